// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_dispatcher.h"

#include "error_reporting.h"

#include <condition_variable>
#include <deque>
#include <thread>

namespace proton {

namespace {
/// Minimum interval between "queue full" warnings per observer
constexpr auto DROP_LOG_INTERVAL = std::chrono::seconds(5);
} // namespace

// ============================================================================
// ObserverChannel
// ============================================================================

class EventDispatcher::ObserverChannel
    : public std::enable_shared_from_this<EventDispatcher::ObserverChannel> {
  public:
    ObserverChannel(ObserverId id, std::string filter, ApEventCallback callback, size_t capacity)
        : id_(id), filter_(std::move(filter)), callback_(std::move(callback)),
          capacity_(capacity) {}

    ~ObserverChannel() {
        // Only reached on the delivery thread itself or after close() joined
        if (thread_.joinable()) {
            thread_.detach();
        }
    }

    void start() {
        // The thread keeps the channel alive so a callback may remove itself
        thread_ = std::thread([self = shared_from_this()] { self->run(); });
    }

    bool accepts(const ApEvent& event) const {
        return filter_.empty() || filter_ == event.handle;
    }

    void offer(const ApEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            uint64_t total = ++dropped_;
            auto now = std::chrono::steady_clock::now();
            if (total == 1 || now - last_drop_log_ >= DROP_LOG_INTERVAL) {
                last_drop_log_ = now;
                spdlog::warn("[EventDispatcher] Observer {} queue full ({} events), dropped {} "
                             "so far (latest: {})",
                             id_, capacity_, total, event.describe());
            }
            return;
        }
        queue_.push_back(event);
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            queue_.clear();
        }
        cv_.notify_all();
        idle_cv_.notify_all();

        if (!thread_.joinable()) {
            return;
        }
        if (thread_.get_id() == std::this_thread::get_id()) {
            // Removed from inside its own callback: finish after it returns
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    bool wait_idle(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_until(lock, deadline,
                                   [this] { return closed_ || (queue_.empty() && !delivering_); });
    }

    uint64_t dropped() const {
        return dropped_.load();
    }

  private:
    void run() {
        spdlog::trace("[EventDispatcher] Observer {} delivery thread started", id_);

        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (closed_) {
                break;
            }

            ApEvent event = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
            lock.unlock();

            try {
                callback_(event);
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("[EventDispatcher] Observer {} threw on {}: {}", id_,
                                   event.describe(), e.what());
            }

            lock.lock();
            delivering_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }

        spdlog::trace("[EventDispatcher] Observer {} delivery thread exiting", id_);
    }

    const ObserverId id_;
    const std::string filter_;
    const ApEventCallback callback_;
    const size_t capacity_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<ApEvent> queue_;
    bool closed_ = false;
    bool delivering_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::chrono::steady_clock::time_point last_drop_log_{};

    std::thread thread_;
};

// ============================================================================
// EventDispatcher
// ============================================================================

EventDispatcher::EventDispatcher(size_t default_capacity)
    : default_capacity_(default_capacity > 0 ? default_capacity : 1) {}

EventDispatcher::~EventDispatcher() {
    shutdown();
}

ObserverId EventDispatcher::add_observer(const std::string& handle_filter,
                                         ApEventCallback callback, size_t capacity) {
    ObserverId id = next_id_.fetch_add(1);
    auto channel = std::make_shared<ObserverChannel>(
        id, handle_filter, std::move(callback), capacity > 0 ? capacity : default_capacity_);
    channel->start();

    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers_.emplace(id, channel);
    }

    spdlog::debug("[EventDispatcher] Added observer {} (filter='{}', capacity={})", id,
                  handle_filter, capacity > 0 ? capacity : default_capacity_);
    return id;
}

bool EventDispatcher::remove_observer(ObserverId id) {
    std::shared_ptr<ObserverChannel> channel;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        auto it = observers_.find(id);
        if (it == observers_.end()) {
            return false;
        }
        channel = std::move(it->second);
        observers_.erase(it);
    }

    // Joined outside the lock: the callback may itself be adding or removing observers
    channel->close();
    spdlog::debug("[EventDispatcher] Removed observer {}", id);
    return true;
}

std::vector<std::shared_ptr<EventDispatcher::ObserverChannel>>
EventDispatcher::channels_snapshot() const {
    std::vector<std::shared_ptr<ObserverChannel>> channels;
    std::lock_guard<std::mutex> lock(observers_mutex_);
    channels.reserve(observers_.size());
    for (const auto& [id, channel] : observers_) {
        channels.push_back(channel);
    }
    return channels;
}

void EventDispatcher::publish(const ApEvent& event) {
    spdlog::trace("[EventDispatcher] Publishing {}", event.describe());
    for (const auto& channel : channels_snapshot()) {
        if (channel->accepts(event)) {
            channel->offer(event);
        }
    }
}

void EventDispatcher::publish(const std::vector<ApEvent>& events) {
    if (events.empty()) {
        return;
    }
    auto channels = channels_snapshot();
    for (const auto& event : events) {
        spdlog::trace("[EventDispatcher] Publishing {}", event.describe());
        for (const auto& channel : channels) {
            if (channel->accepts(event)) {
                channel->offer(event);
            }
        }
    }
}

uint64_t EventDispatcher::dropped_count(ObserverId id) const {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto it = observers_.find(id);
    return it == observers_.end() ? 0 : it->second->dropped();
}

size_t EventDispatcher::observer_count() const {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    return observers_.size();
}

bool EventDispatcher::flush(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (const auto& channel : channels_snapshot()) {
        if (!channel->wait_idle(deadline)) {
            spdlog::debug("[EventDispatcher] flush() timed out after {}ms", timeout.count());
            return false;
        }
    }
    return true;
}

void EventDispatcher::shutdown() {
    std::map<ObserverId, std::shared_ptr<ObserverChannel>> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers.swap(observers_);
    }
    for (auto& [id, channel] : observers) {
        channel->close();
    }
    if (!observers.empty()) {
        spdlog::debug("[EventDispatcher] Shut down {} observers", observers.size());
    }
}

} // namespace proton
