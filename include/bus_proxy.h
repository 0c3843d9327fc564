// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hv/json.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace proton {

using json = nlohmann::json;

struct ControllerSettings;

/**
 * @brief Transport-level outcome of a control bus call
 */
enum class BusErrorType {
    NONE = 0,       ///< Call delivered and answered
    TIMEOUT,        ///< No reply from the daemon in time (transient)
    UNAVAILABLE,    ///< Daemon socket missing or connection refused (transient)
    REMOTE_ERROR,   ///< Daemon answered with an error (semantic, never retried)
    PROTOCOL_ERROR  ///< Reply could not be read at all
};

/**
 * @brief Reply to a control bus call
 *
 * The body is the daemon's reply in the bus's native representation. For the
 * hostapd control interface this is:
 * @code
 *   { "status": "OK" | "DATA" | "EMPTY",
 *     "fields": { "key": "value", ... },   // key=value lines
 *     "lines":  [ "bare line", ... ] }     // lines without '='
 * @endcode
 */
struct BusReply {
    BusErrorType error = BusErrorType::NONE;
    std::string error_message;
    json body;

    bool ok() const {
        return error == BusErrorType::NONE;
    }

    /// Timeouts and unavailability may succeed when retried
    bool is_transient() const {
        return error == BusErrorType::TIMEOUT || error == BusErrorType::UNAVAILABLE;
    }

    static BusReply success(json body) {
        BusReply r;
        r.body = std::move(body);
        return r;
    }

    static BusReply failure(BusErrorType type, const std::string& message) {
        BusReply r;
        r.error = type;
        r.error_message = message;
        return r;
    }
};

const char* bus_error_name(BusErrorType type);

/**
 * @brief Signal emitted by the remote daemon
 *
 * args follows the same native representation as BusReply::body:
 * @code
 *   { "level": 3, "params": [ "positional", ... ], "fields": { "key": "value" } }
 * @endcode
 */
struct SignalPayload {
    std::string object_path;
    std::string interface;
    std::string name;
    json args;
};

using SignalHandler = std::function<void(const SignalPayload&)>;

/**
 * @brief Subscription handle returned by BusProxy::subscribe()
 *
 * Valid IDs are always > 0; 0 indicates a failed subscription.
 */
using SubscriptionId = uint64_t;
constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

/// Subscribe to every signal of an object
constexpr const char* ALL_SIGNALS = "*";

/**
 * @brief Abstract control bus client
 *
 * The lifecycle controller only depends on this shape. Concrete
 * implementations handle transport details:
 * - HostapdBusProxy: hostapd control interface sockets (wpa_ctrl + libhv)
 * - BusProxyMock: simulated daemon for tests and --test mode
 *
 * Thread safety: call(), subscribe() and unsubscribe() may be called from any
 * thread. Signal handlers run on the proxy's delivery thread, one at a time,
 * in the order the daemon emitted the signals.
 */
class BusProxy {
  public:
    virtual ~BusProxy() = default;

    /**
     * @brief Invoke a method on a remote object (blocking)
     *
     * @param object_path Remote object address
     * @param interface Interface the method belongs to
     * @param method Method name
     * @param args Method arguments (JSON array)
     * @return Reply body or transport/remote error
     */
    virtual BusReply call(const std::string& object_path, const std::string& interface,
                          const std::string& method, const json& args) = 0;

    /**
     * @brief Subscribe to a named signal of a remote object
     *
     * @param signal_name Signal to receive, or ALL_SIGNALS
     * @return Subscription ID, or INVALID_SUBSCRIPTION_ID if the object cannot be monitored
     */
    virtual SubscriptionId subscribe(const std::string& object_path, const std::string& interface,
                                     const std::string& signal_name, SignalHandler handler) = 0;

    /**
     * @brief Remove a subscription
     *
     * @return true if the subscription existed
     */
    virtual bool unsubscribe(SubscriptionId id) = 0;

    /**
     * @brief Create the bus proxy selected by @p settings
     *
     * - settings.mock_daemon: BusProxyMock with automatic confirmations
     * - otherwise: HostapdBusProxy on settings.control_dir
     */
    static std::unique_ptr<BusProxy> create(const ControllerSettings& settings);
};

} // namespace proton
