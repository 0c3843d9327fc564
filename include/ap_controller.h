// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ap_error.h"
#include "ap_events.h"
#include "ap_types.h"
#include "bus_proxy.h"
#include "controller_settings.h"
#include "daemon_object_model.h"
#include "event_dispatcher.h"
#include "state_cache.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace proton {

/**
 * @brief Access point lifecycle controller
 *
 * Turns a desired AccessPointConfig into control bus calls, follows the
 * daemon's signals, and keeps a consistent view of every access point it
 * manages. Access points are addressed by handle (the wireless interface
 * name, e.g. "wlan0").
 *
 * State machine:
 * @code
 *   Down --configure--> Configuring --> Down | Error
 *   Down | Error --start--> Starting --> Up | Error
 *   Up | Error --stop--> Stopping --> Down | Error
 *   any --daemon fault--> Error (reconciled before the next operation)
 * @endcode
 *
 * configure(), start() and stop() block until the daemon confirms or the
 * operation timeout passes. Only one operation runs per handle at a time;
 * a second one gets BUSY. Different handles proceed independently.
 *
 * Usage:
 * @code
 *   AccessPointController ctl(BusProxy::create(settings), settings);
 *   ctl.subscribe("wlan0", [](const ApEvent& e) { spdlog::info("{}", e.describe()); });
 *
 *   AccessPointConfig cfg;
 *   cfg.ssid = "workshop";
 *   cfg.passphrase = "correct horse";
 *   if (auto err = ctl.configure("wlan0", cfg); !err) { ... }
 *   if (auto err = ctl.start("wlan0"); !err) { ... }
 * @endcode
 *
 * Thread-safe.
 */
class AccessPointController {
  public:
    AccessPointController(std::shared_ptr<BusProxy> bus, ControllerSettings settings = {});
    ~AccessPointController();

    AccessPointController(const AccessPointController&) = delete;
    AccessPointController& operator=(const AccessPointController&) = delete;

    /**
     * @brief Start following @p handle
     *
     * Subscribes to the daemon's signals for the access point and loads its
     * current state. configure(), start() and refresh() attach implicitly.
     */
    ApError attach(const std::string& handle);

    /**
     * @brief Apply a configuration
     *
     * Validated locally first: an invalid configuration fails with
     * INVALID_CONFIG before any bus call. Valid from Down or Error only.
     * The configuration shows up in snapshot() once every call was
     * acknowledged.
     */
    ApError configure(const std::string& handle, const AccessPointConfig& config);

    /**
     * @brief Bring the access point up
     *
     * Returns once the daemon reports the AP enabled. A fault or disable
     * signal while starting gives REJECTED; no signal in time gives TIMEOUT
     * and leaves the AP in Error.
     */
    ApError start(const std::string& handle);

    /**
     * @brief Take the access point down
     *
     * Idempotent: stopping an AP that is Down, or was never attached, returns
     * success without touching the bus.
     */
    ApError stop(const std::string& handle);

    /**
     * @brief Re-read state and station list from the daemon
     *
     * Station differences are emitted as CLIENT_JOINED / CLIENT_LEFT.
     * Signals that arrive while the daemon is being read are newer than the
     * reply: the read is repeated rather than letting the reply undo them.
     */
    ApError refresh(const std::string& handle);

    /**
     * @brief Disconnect one station from an access point that is Up
     *
     * Returns once the daemon acknowledged the request. The station leaves
     * the snapshot (with CLIENT_LEFT) when the daemon reports the
     * disconnection, not before. A station that is not associated is a
     * no-op success.
     */
    ApError deauthenticate(const std::string& handle, const MacAddress& station);

    /// Consistent copy of the cached state (never touches the bus)
    AccessPointSnapshot snapshot(const std::string& handle) const;

    /// Attached handles, sorted
    std::vector<std::string> handles() const;

    /**
     * @brief Register an event observer
     *
     * @param handle_filter Only events of this handle (empty = all handles)
     * @param callback Invoked on a delivery thread owned by the observer
     * @param queue_capacity Events buffered before drops (0 = observer_queue_capacity)
     */
    ObserverId subscribe(const std::string& handle_filter, ApEventCallback callback,
                         size_t queue_capacity = 0);

    /**
     * @brief Remove an observer
     *
     * Blocks until its delivery thread finished, except when called from
     * inside that observer's own callback: the thread then finishes detached
     * after the callback returns, so whatever the callback captured must
     * stay valid until then.
     */
    bool unsubscribe(ObserverId id);

    /// Events dropped for @p id because its queue was full
    uint64_t dropped_events(ObserverId id) const;

    /// Malformed daemon signals dropped so far
    uint64_t decode_failures() const {
        return decode_failures_.load();
    }

    /// Wait until observers received every event published so far
    bool flush_events(std::chrono::milliseconds timeout);

    const ControllerSettings& settings() const {
        return settings_;
    }

  private:
    using Deadline = std::chrono::steady_clock::time_point;

    struct HandleContext {
        std::atomic<bool> busy{false};
        std::mutex attach_mutex;
        bool attached = false;
        std::vector<SubscriptionId> subscriptions;
        std::atomic<bool> stream_ended{false}; ///< Subscriptions are dead; renew them
    };

    /// Serializes signal handling with destruction
    struct AliveGuard {
        std::mutex mutex;
        bool alive = true;
    };

    /// Holds a handle's busy flag for the duration of one operation
    class BusyGuard {
      public:
        explicit BusyGuard(std::atomic<bool>& flag);
        ~BusyGuard();
        BusyGuard(const BusyGuard&) = delete;
        BusyGuard& operator=(const BusyGuard&) = delete;

        bool acquired() const {
            return acquired_;
        }

      private:
        std::atomic<bool>& flag_;
        bool acquired_;
    };

    std::shared_ptr<HandleContext> context(const std::string& handle);
    Deadline make_deadline() const;

    ApError ensure_attached(const std::string& handle, const std::string& op);
    ApError reconcile_if_needed(const std::string& handle, const std::string& op,
                                Deadline deadline);
    ApError reconcile(const std::string& handle, const std::string& op, Deadline deadline);
    ApError list_stations(const std::string& handle, const std::string& op, Deadline deadline,
                          std::vector<Station>& out);

    /**
     * @brief Issue one call, retrying transient failures with backoff
     *
     * REMOTE_ERROR → REJECTED (never retried); retries exhausted →
     * BUS_UNAVAILABLE; deadline reached → TIMEOUT.
     */
    ApError call_with_retry(const BusCall& call, const std::string& handle, const std::string& op,
                            Deadline deadline, json* body = nullptr);

    /// call_with_retry() plus an "OK" acknowledgment check
    ApError call_acknowledged(const BusCall& call, const std::string& handle,
                              const std::string& op, Deadline deadline);

    void on_signal(const SignalPayload& payload);
    void apply_state_signal(ApRecord& rec, const DaemonSignal& sig, std::vector<ApEvent>& events);

    std::shared_ptr<BusProxy> bus_;
    ControllerSettings settings_;
    DaemonObjectModel model_;

    // Declared before cache_: the cache publishes into it
    EventDispatcher dispatcher_;
    StateCache cache_;

    std::mutex contexts_mutex_;
    std::map<std::string, std::shared_ptr<HandleContext>> contexts_;

    std::atomic<uint64_t> decode_failures_{0};
    std::shared_ptr<AliveGuard> alive_ = std::make_shared<AliveGuard>();
};

} // namespace proton
