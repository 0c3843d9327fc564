// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bus_proxy.h"
#include "mac_address.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

namespace proton {

/**
 * @brief Simulated hostapd daemon for tests and --test mode
 *
 * Answers the same commands as the real control interface (SET, ACL
 * commands, ENABLE, DISABLE, DEAUTHENTICATE, STATUS, STA-FIRST, STA-NEXT)
 * from an in-memory model of each object path, and emits signals from a
 * worker thread in the order they were scheduled.
 *
 * With auto-confirm on (the default), ENABLE and DISABLE are followed by
 * AP-ENABLED / AP-DISABLED after the confirm delay, and DEAUTHENTICATE of an
 * associated station by AP-STA-DISCONNECTED. Tests turn it off to simulate
 * a daemon that never confirms, or script signals by hand with emit_signal().
 *
 * Every emitted signal also updates the simulated daemon, so STATUS and the
 * station list stay consistent with what subscribers saw.
 *
 * CTRL-EVENT-TERMINATING ends the event stream of its object path, like the
 * daemon closing its monitor socket: later signals on that path reach nobody
 * until something subscribes to the path again.
 */
class BusProxyMock : public BusProxy {
  public:
    BusProxyMock();
    ~BusProxyMock() override;

    BusReply call(const std::string& object_path, const std::string& interface,
                  const std::string& method, const json& args) override;
    SubscriptionId subscribe(const std::string& object_path, const std::string& interface,
                             const std::string& signal_name, SignalHandler handler) override;
    bool unsubscribe(SubscriptionId id) override;

    // ========================================================================
    // Behavior controls
    // ========================================================================

    void set_auto_confirm(bool enabled);
    void set_confirm_delay(std::chrono::milliseconds delay);

    /// Delay applied inside every call() before it is answered
    void set_call_delay(std::chrono::milliseconds delay);

    /// The next @p count calls fail with @p type before reaching the daemon
    void fail_next_calls(int count, BusErrorType type = BusErrorType::TIMEOUT);

    /**
     * @brief Answer commands starting with @p command_prefix with an error
     *
     * The prefix is matched against "METHOD arg1 arg2...", e.g. "ENABLE" or
     * "SET channel".
     */
    void reject_command(const std::string& command_prefix, const std::string& reason = "FAIL");
    void clear_rejections();

    /// Schedule a signal (delivered on the worker thread)
    void emit_signal(const std::string& object_path, const std::string& name,
                     const std::vector<std::string>& params = {}, const json& fields = json(),
                     std::chrono::milliseconds delay = std::chrono::milliseconds(0));

    /**
     * @brief Close the event stream of @p object_path
     *
     * Delivers the CTRL-EVENT-TERMINATING the hostapd bus reports for a
     * monitor socket the daemon closed, then stops delivering on the path.
     */
    void drop_monitor(const std::string& object_path,
                      std::chrono::milliseconds delay = std::chrono::milliseconds(0));

    /// Whether signals on @p object_path currently reach subscribers
    bool monitor_open(const std::string& object_path) const;

    /// Change the simulated state without emitting anything ("ENABLED", "DISABLED", "ACS"...)
    void set_daemon_state(const std::string& object_path, const std::string& raw_state);

    /// Add a station silently, as if it associated before the controller attached
    void add_station(const std::string& object_path, const MacAddress& mac,
                     std::optional<int> signal_dbm = std::nullopt);

    std::string daemon_state(const std::string& object_path) const;

    /// Last value written with SET, empty if never set
    std::string daemon_field(const std::string& object_path, const std::string& field) const;

    std::vector<MacAddress> accept_list(const std::string& object_path) const;
    std::vector<MacAddress> deny_list(const std::string& object_path) const;

    // ========================================================================
    // Inspection
    // ========================================================================

    /// Calls received, including failed ones
    int call_count() const;
    int call_count(const std::string& method) const;

    /// Every call as "METHOD arg1 arg2..."
    std::vector<std::string> call_log() const;
    void reset_calls();

    size_t subscription_count() const;

    /// Wait until every scheduled signal has been delivered
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

  private:
    struct SimulatedAp {
        std::string state = "DISABLED";
        std::map<std::string, std::string> fields;
        std::vector<MacAddress> accept_acl;
        std::vector<MacAddress> deny_acl;
        std::map<MacAddress, std::optional<int>> stations;
    };

    struct Subscription {
        std::string object_path;
        std::string signal_name;
        SignalHandler handler;
    };

    BusReply handle_command(const std::string& path, const std::string& method,
                            const std::vector<std::string>& args);
    BusReply station_reply(const std::string& path, const MacAddress& mac,
                           const std::optional<int>& signal_dbm) const;
    void apply_signal(const SignalPayload& payload);
    void schedule(SignalPayload payload, std::chrono::milliseconds delay);
    void worker_loop();

    mutable std::mutex mutex_;
    std::map<std::string, SimulatedAp> aps_;
    std::vector<std::string> call_log_;

    bool auto_confirm_ = true;
    std::chrono::milliseconds confirm_delay_{20};
    std::chrono::milliseconds call_delay_{0};
    int fail_remaining_ = 0;
    BusErrorType fail_type_ = BusErrorType::TIMEOUT;
    std::vector<std::pair<std::string, std::string>> rejections_;

    std::map<SubscriptionId, Subscription> subscriptions_;
    std::set<std::string> closed_monitors_;
    std::atomic<SubscriptionId> next_subscription_id_{1};

    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::multimap<std::chrono::steady_clock::time_point, SignalPayload> queue_;
    bool delivering_ = false;
    bool running_ = true;
    std::thread worker_;
};

} // namespace proton
