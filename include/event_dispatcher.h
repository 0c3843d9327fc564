// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ap_events.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace proton {

/**
 * @brief Fan-out of access point events to registered observers
 *
 * Every observer owns a bounded queue and a delivery thread, so a slow or
 * throwing callback only affects itself. publish() never blocks on an
 * observer: when an observer's queue is full the new event is dropped for
 * that observer and counted.
 *
 * Events published for one handle reach each observer in publish order.
 * add_observer() and remove_observer() may be called from any thread,
 * including from inside an observer callback.
 */
class EventDispatcher {
  public:
    /// @param default_capacity Queue bound used when add_observer() gets 0
    explicit EventDispatcher(size_t default_capacity = 64);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Register an observer
     *
     * @param handle_filter Deliver only events of this handle (empty = all)
     * @param callback Invoked on the observer's delivery thread
     * @param capacity Queue bound (0 = default)
     * @return Observer ID (never INVALID_OBSERVER_ID)
     */
    ObserverId add_observer(const std::string& handle_filter, ApEventCallback callback,
                            size_t capacity = 0);

    /**
     * @brief Unregister an observer
     *
     * Queued events that were not delivered yet are discarded. When called
     * from another thread, waits for a callback in progress to return.
     * When called from the observer's own callback it cannot wait: the
     * delivery thread is detached and exits once the callback returns, so
     * the callback's captures must outlive that return.
     *
     * @return true if the observer existed
     */
    bool remove_observer(ObserverId id);

    void publish(const ApEvent& event);
    void publish(const std::vector<ApEvent>& events);

    /// Events dropped for @p id because its queue was full
    uint64_t dropped_count(ObserverId id) const;

    size_t observer_count() const;

    /**
     * @brief Wait until every observer queue is drained
     *
     * Must not be called from an observer callback.
     *
     * @return false on timeout
     */
    bool flush(std::chrono::milliseconds timeout);

    /// Remove all observers (also done by the destructor)
    void shutdown();

  private:
    class ObserverChannel;

    std::vector<std::shared_ptr<ObserverChannel>> channels_snapshot() const;

    size_t default_capacity_;
    std::atomic<ObserverId> next_id_{1};

    mutable std::mutex observers_mutex_;
    std::map<ObserverId, std::shared_ptr<ObserverChannel>> observers_;
};

} // namespace proton
