// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bus_proxy.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "hv/EventLoop.h"
#include "hv/EventLoopThread.h"
#include "hv/hloop.h"

// Forward declaration - avoid including wpa_ctrl.h in header
struct wpa_ctrl;

namespace proton {

/**
 * @brief Parse a hostapd control reply into a BusReply
 *
 * - "OK" → status OK
 * - "FAIL", "FAIL-...", "UNKNOWN COMMAND" → REMOTE_ERROR with the text as message
 * - empty → status EMPTY
 * - anything else → status DATA, key=value lines into "fields", other lines into "lines"
 */
BusReply parse_control_reply(const std::string& text);

/**
 * @brief Parse an unsolicited hostapd event
 *
 * Accepts "[IFNAME=<if> ]<level>NAME param... key=value...". Returns nullopt
 * for empty text or a missing event name.
 */
std::optional<SignalPayload> parse_control_event(const std::string& object_path,
                                                 const std::string& text);

/// Copy of @p command safe to log (passphrase values replaced)
std::string sanitize_command_for_log(const std::string& command);

/**
 * @brief hostapd control interface transport using libhv
 *
 * Object paths are control socket paths (e.g. /var/run/hostapd/wlan0). Each
 * path gets two wpa_ctrl connections, opened on demand:
 * - control: synchronous requests via wpa_ctrl_request(), serialized per path
 * - monitor: attached to the event stream while anything subscribes to the
 *   path, read on the event loop thread
 *
 * Architecture:
 * - Inherits privately from hv::EventLoopThread for async I/O
 * - Signal handlers run on the event loop thread, in arrival order
 * - A monitor socket closed by the daemon is reported as a synthetic
 *   CTRL-EVENT-TERMINATING signal on that path
 */
class HostapdBusProxy : public BusProxy, private hv::EventLoopThread {
  public:
    HostapdBusProxy();
    ~HostapdBusProxy() override;

    BusReply call(const std::string& object_path, const std::string& interface,
                  const std::string& method, const json& args) override;
    SubscriptionId subscribe(const std::string& object_path, const std::string& interface,
                             const std::string& signal_name, SignalHandler handler) override;
    bool unsubscribe(SubscriptionId id) override;

  private:
    struct Endpoint {
        HostapdBusProxy* owner = nullptr;
        std::string path;

        std::mutex ctrl_mutex; ///< Serializes requests on this path
        struct wpa_ctrl* ctrl = nullptr;

        // Event loop thread only
        struct wpa_ctrl* monitor = nullptr;
        hio_t* monitor_io = nullptr;
    };

    struct Subscription {
        std::string object_path;
        std::string signal_name;
        SignalHandler handler;
    };

    Endpoint& endpoint(const std::string& path);

    /// Open monitor for @p ep (event loop thread); empty string on success
    std::string attach_monitor(Endpoint& ep);
    void detach_monitor(Endpoint& ep);
    void close_control(Endpoint& ep);

    /// Run @p fn on the event loop thread and wait for it
    void run_in_loop_sync(const std::function<void()>& fn);

    void handle_events(Endpoint& ep, void* data, int len);
    void deliver(const SignalPayload& payload);

    static void _handle_events(hio_t* io, void* data, int readbyte);
    static void _handle_close(hio_t* io);

    std::mutex endpoints_mutex_;
    std::map<std::string, std::unique_ptr<Endpoint>> endpoints_;

    std::mutex subscriptions_mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    std::atomic<SubscriptionId> next_subscription_id_{1};
};

} // namespace proton
