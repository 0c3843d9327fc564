// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ap_events.h"
#include "ap_types.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace proton {

/**
 * @brief Mutable per-handle state, only reachable inside StateCache::update()
 *
 * The mutators keep the data-model invariants and append the events they
 * imply. Code that writes the fields directly must keep them itself:
 * stations only while UP, and a non-empty reason while ERROR.
 */
struct ApRecord {
    std::string handle;
    std::optional<AccessPointConfig> config;
    LifecycleState state = LifecycleState::DOWN;
    std::string error_reason;
    std::map<MacAddress, Station> stations;
    bool needs_reconcile = false;

    /// Bumped for every daemon signal applied to this record
    uint64_t signal_revision = 0;

    /**
     * @brief Transition to @p to
     *
     * Leaving UP drops every station with a CLIENT_LEFT event. Entering ERROR
     * with an empty reason records "unknown error". No event when the state
     * does not change (an ERROR reason is still updated).
     *
     * @return true if the state changed
     */
    bool set_state(LifecycleState to, std::vector<ApEvent>& events, const std::string& reason = "");

    /// ERROR with @p reason, and mark for reconciliation
    void fault(const std::string& reason, std::vector<ApEvent>& events);

    /**
     * @brief Add or refresh a station
     *
     * A known MAC only has its metrics updated.
     *
     * @return true if the station is new (CLIENT_JOINED emitted)
     */
    bool add_station(const Station& station, std::vector<ApEvent>& events);

    /// @return true if the station was present (CLIENT_LEFT emitted)
    bool remove_station(const MacAddress& mac, std::vector<ApEvent>& events);

    /// Replace the station set with @p current, emitting the differences
    void replace_stations(const std::vector<Station>& current, std::vector<ApEvent>& events);

    AccessPointSnapshot snapshot() const;
};

/**
 * @brief Authoritative mirror of every attached access point
 *
 * Each handle has its own mutex and condition variable, so signal ingestion
 * for one interface never waits on another. Events produced by an update are
 * handed to the sink while the handle's lock is still held, which makes the
 * per-handle event order equal to the mutation order.
 *
 * Thread-safe.
 */
class StateCache {
  public:
    using EventSink = std::function<void(const std::vector<ApEvent>&)>;
    using UpdateFn = std::function<void(ApRecord&, std::vector<ApEvent>&)>;

    /// @param sink Receives the events of each update (must not block)
    explicit StateCache(EventSink sink = nullptr);

    StateCache(const StateCache&) = delete;
    StateCache& operator=(const StateCache&) = delete;

    /// Create the record for @p handle if needed; @return true if created
    bool ensure(const std::string& handle);

    bool contains(const std::string& handle) const;

    /// Handles with a record, sorted
    std::vector<std::string> handles() const;

    /**
     * @brief Consistent copy of one access point
     *
     * Unknown handles report DOWN with no configuration and no stations.
     */
    AccessPointSnapshot snapshot(const std::string& handle) const;

    LifecycleState state(const std::string& handle) const;

    /// ApRecord::signal_revision of @p handle (0 for unknown handles)
    uint64_t signal_revision(const std::string& handle) const;

    /**
     * @brief Mutate a record in its exclusive scope
     *
     * Creates the record if needed, runs @p fn, publishes the events it
     * produced, then wakes waiters.
     */
    void update(const std::string& handle, const UpdateFn& fn);

    /**
     * @brief Block until the state of @p handle is no longer @p from
     *
     * @return The state when the wait ended (equal to @p from on timeout)
     */
    LifecycleState wait_for_state_change(const std::string& handle, LifecycleState from,
                                         std::chrono::steady_clock::time_point deadline) const;

  private:
    struct Entry {
        mutable std::mutex mutex;
        mutable std::condition_variable changed;
        ApRecord record;
    };

    std::shared_ptr<Entry> find(const std::string& handle) const;
    std::shared_ptr<Entry> find_or_create(const std::string& handle, bool* created = nullptr);

    EventSink sink_;

    mutable std::mutex entries_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace proton
