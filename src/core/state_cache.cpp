// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_cache.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace proton {

// ============================================================================
// ApRecord
// ============================================================================

bool ApRecord::set_state(LifecycleState to, std::vector<ApEvent>& events,
                         const std::string& reason) {
    if (to == LifecycleState::ERROR) {
        error_reason = reason.empty() ? "unknown error" : reason;
    }

    if (to == state) {
        return false;
    }

    LifecycleState from = state;

    if (from == LifecycleState::UP) {
        for (const auto& [mac, station] : stations) {
            events.push_back(ApEvent::client_left(handle, station));
        }
        stations.clear();
    }

    state = to;
    if (to != LifecycleState::ERROR) {
        error_reason.clear();
    }

    spdlog::debug("[StateCache] {}: {} -> {}{}", handle, lifecycle_state_name(from),
                  lifecycle_state_name(to),
                  to == LifecycleState::ERROR ? " (" + error_reason + ")" : std::string());
    events.push_back(ApEvent::state_changed(handle, from, to,
                                            to == LifecycleState::ERROR ? error_reason : ""));
    return true;
}

void ApRecord::fault(const std::string& reason, std::vector<ApEvent>& events) {
    needs_reconcile = true;
    set_state(LifecycleState::ERROR, events, reason);
}

bool ApRecord::add_station(const Station& station, std::vector<ApEvent>& events) {
    auto it = stations.find(station.mac);
    if (it != stations.end()) {
        // Duplicate association: keep the original timestamp, take newer metrics
        if (station.signal_dbm) {
            it->second.signal_dbm = station.signal_dbm;
        }
        if (station.connected_seconds) {
            it->second.connected_seconds = station.connected_seconds;
        }
        return false;
    }

    stations.emplace(station.mac, station);
    events.push_back(ApEvent::client_joined(handle, station));
    return true;
}

bool ApRecord::remove_station(const MacAddress& mac, std::vector<ApEvent>& events) {
    auto it = stations.find(mac);
    if (it == stations.end()) {
        return false;
    }
    events.push_back(ApEvent::client_left(handle, it->second));
    stations.erase(it);
    return true;
}

void ApRecord::replace_stations(const std::vector<Station>& current,
                                std::vector<ApEvent>& events) {
    std::set<MacAddress> present;
    for (const auto& s : current) {
        present.insert(s.mac);
    }

    for (auto it = stations.begin(); it != stations.end();) {
        if (present.count(it->first) == 0) {
            events.push_back(ApEvent::client_left(handle, it->second));
            it = stations.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& s : current) {
        add_station(s, events);
    }
}

AccessPointSnapshot ApRecord::snapshot() const {
    AccessPointSnapshot snap;
    snap.handle = handle;
    snap.config = config;
    snap.state = state;
    snap.error_reason = error_reason;
    snap.needs_reconcile = needs_reconcile;
    snap.stations.reserve(stations.size());
    for (const auto& [mac, station] : stations) {
        snap.stations.push_back(station);
    }
    return snap;
}

// ============================================================================
// StateCache
// ============================================================================

StateCache::StateCache(EventSink sink) : sink_(std::move(sink)) {}

std::shared_ptr<StateCache::Entry> StateCache::find(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    auto it = entries_.find(handle);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<StateCache::Entry> StateCache::find_or_create(const std::string& handle,
                                                              bool* created) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    auto it = entries_.find(handle);
    if (it != entries_.end()) {
        if (created) {
            *created = false;
        }
        return it->second;
    }

    auto entry = std::make_shared<Entry>();
    entry->record.handle = handle;
    entries_.emplace(handle, entry);
    if (created) {
        *created = true;
    }
    spdlog::trace("[StateCache] Created record for {}", handle);
    return entry;
}

bool StateCache::ensure(const std::string& handle) {
    bool created = false;
    find_or_create(handle, &created);
    return created;
}

bool StateCache::contains(const std::string& handle) const {
    return find(handle) != nullptr;
}

std::vector<std::string> StateCache::handles() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        result.reserve(entries_.size());
        for (const auto& [handle, entry] : entries_) {
            result.push_back(handle);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

AccessPointSnapshot StateCache::snapshot(const std::string& handle) const {
    auto entry = find(handle);
    if (!entry) {
        AccessPointSnapshot snap;
        snap.handle = handle;
        return snap;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record.snapshot();
}

LifecycleState StateCache::state(const std::string& handle) const {
    auto entry = find(handle);
    if (!entry) {
        return LifecycleState::DOWN;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record.state;
}

uint64_t StateCache::signal_revision(const std::string& handle) const {
    auto entry = find(handle);
    if (!entry) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record.signal_revision;
}

void StateCache::update(const std::string& handle, const UpdateFn& fn) {
    auto entry = find_or_create(handle);

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        std::vector<ApEvent> events;
        fn(entry->record, events);

        if (!events.empty() && sink_) {
            sink_(events);
        }
    }
    entry->changed.notify_all();
}

LifecycleState StateCache::wait_for_state_change(
    const std::string& handle, LifecycleState from,
    std::chrono::steady_clock::time_point deadline) const {
    auto entry = find(handle);
    if (!entry) {
        return LifecycleState::DOWN;
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    entry->changed.wait_until(lock, deadline, [&] { return entry->record.state != from; });
    return entry->record.state;
}

} // namespace proton
