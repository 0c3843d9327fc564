// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bus_proxy_hostapd.h"

#include "error_reporting.h"

#include "wpa_ctrl.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <future>
#include <sstream>

namespace proton {

namespace {

constexpr const char* INTERFACE_NAME = "hostapd";

/// SET fields whose values must never reach a log
const char* const SECRET_FIELDS[] = {"wpa_passphrase", "sae_password", "wpa_psk"};

std::string trim_trailing_newlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

// ============================================================================
// Control text codec
// ============================================================================

BusReply parse_control_reply(const std::string& raw) {
    std::string text = trim_trailing_newlines(raw);

    if (text == "OK") {
        return BusReply::success(
            json{{"status", "OK"}, {"fields", json::object()}, {"lines", json::array()}});
    }
    if (text == "FAIL" || text.compare(0, 5, "FAIL-") == 0 || text == "UNKNOWN COMMAND") {
        return BusReply::failure(BusErrorType::REMOTE_ERROR, text);
    }
    if (text.empty()) {
        return BusReply::success(
            json{{"status", "EMPTY"}, {"fields", json::object()}, {"lines", json::array()}});
    }

    json fields = json::object();
    json lines = json::array();
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            lines.push_back(line);
        } else {
            fields[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }

    return BusReply::success(json{{"status", "DATA"}, {"fields", fields}, {"lines", lines}});
}

std::optional<SignalPayload> parse_control_event(const std::string& object_path,
                                                 const std::string& raw) {
    std::string text = trim_trailing_newlines(raw);

    // Global control interface prefixes events with the interface name
    if (text.compare(0, 7, "IFNAME=") == 0) {
        auto space = text.find(' ');
        if (space == std::string::npos) {
            return std::nullopt;
        }
        text.erase(0, space + 1);
    }

    int level = 0;
    if (!text.empty() && text[0] == '<') {
        auto close = text.find('>');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        level = std::atoi(text.substr(1, close - 1).c_str());
        text.erase(0, close + 1);
    }

    std::istringstream in(text);
    std::string name;
    if (!(in >> name)) {
        return std::nullopt;
    }

    json params = json::array();
    json fields = json::object();
    std::string token;
    while (in >> token) {
        auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            params.push_back(token);
        } else {
            fields[token.substr(0, eq)] = token.substr(eq + 1);
        }
    }

    SignalPayload payload;
    payload.object_path = object_path;
    payload.interface = INTERFACE_NAME;
    payload.name = name;
    payload.args = json{{"level", level}, {"params", params}, {"fields", fields}};
    return payload;
}

std::string sanitize_command_for_log(const std::string& command) {
    for (const char* field : SECRET_FIELDS) {
        std::string marker = std::string("SET ") + field + " ";
        if (command.compare(0, marker.size(), marker) == 0) {
            return marker + "[REDACTED]";
        }
    }
    return command;
}

// ============================================================================
// HostapdBusProxy
// ============================================================================

HostapdBusProxy::HostapdBusProxy() : hv::EventLoopThread(nullptr) {
    hv::EventLoopThread::start(true);
    spdlog::debug("[HostapdBus] Event loop thread started");
}

HostapdBusProxy::~HostapdBusProxy() {
    spdlog::trace("[HostapdBus] Destructor called");

    // Stop the loop before freeing the connections its callbacks use
    hv::EventLoopThread::stop();
    hv::EventLoopThread::join();

    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    for (auto& [path, ep] : endpoints_) {
        detach_monitor(*ep);
        close_control(*ep);
    }
    endpoints_.clear();
}

HostapdBusProxy::Endpoint& HostapdBusProxy::endpoint(const std::string& path) {
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    auto& slot = endpoints_[path];
    if (!slot) {
        slot = std::make_unique<Endpoint>();
        slot->owner = this;
        slot->path = path;
    }
    return *slot;
}

void HostapdBusProxy::run_in_loop_sync(const std::function<void()>& fn) {
    if (!isRunning() || loop()->isInLoopThread()) {
        // Loop thread not running: no I/O callbacks can fire, safe to run here
        fn();
        return;
    }

    std::promise<void> done;
    std::future<void> done_future = done.get_future();
    loop()->runInLoop([&fn, &done]() {
        fn();
        done.set_value();
    });
    done_future.wait();
}

void HostapdBusProxy::close_control(Endpoint& ep) {
    if (ep.ctrl) {
        wpa_ctrl_close(ep.ctrl);
        ep.ctrl = nullptr;
    }
}

BusReply HostapdBusProxy::call(const std::string& object_path, const std::string& interface,
                               const std::string& method, const json& args) {
    if (interface != INTERFACE_NAME) {
        return BusReply::failure(BusErrorType::PROTOCOL_ERROR,
                                 "unsupported interface '" + interface + "'");
    }

    std::string cmd = method;
    if (args.is_array()) {
        for (const auto& a : args) {
            if (!a.is_string()) {
                return BusReply::failure(BusErrorType::PROTOCOL_ERROR,
                                         "argument is not a string: " + a.dump());
            }
            cmd += " " + a.get<std::string>();
        }
    }

    Endpoint& ep = endpoint(object_path);
    std::lock_guard<std::mutex> lock(ep.ctrl_mutex);

    if (ep.ctrl == nullptr) {
        ep.ctrl = wpa_ctrl_open(object_path.c_str());
        if (ep.ctrl == nullptr) {
            int err = errno;
            std::string detail = "cannot open " + object_path + ": " + std::strerror(err);
            if (err == EACCES || err == EPERM) {
                detail += " (check control socket group permissions)";
            }
            spdlog::debug("[HostapdBus] {}", detail);
            return BusReply::failure(BusErrorType::UNAVAILABLE, detail);
        }
        spdlog::debug("[HostapdBus] Opened control connection to {}", object_path);
    }

    // SECURITY: Don't log passphrases
    std::string safe_cmd = sanitize_command_for_log(cmd);
    spdlog::trace("[HostapdBus] {} <- {}", object_path, safe_cmd);

    char resp[8192];
    size_t len = sizeof(resp) - 1;
    int result = wpa_ctrl_request(ep.ctrl, cmd.c_str(), cmd.length(), resp, &len, nullptr);
    if (result == -2) {
        spdlog::debug("[HostapdBus] {} timed out on {}", safe_cmd, object_path);
        return BusReply::failure(BusErrorType::TIMEOUT, "no reply to " + method);
    }
    if (result != 0) {
        // Socket is probably stale (daemon restarted): reopen on the next call
        LOG_WARN_INTERNAL("[HostapdBus] {} failed on {} (error code: {})", safe_cmd, object_path,
                          result);
        close_control(ep);
        return BusReply::failure(BusErrorType::UNAVAILABLE,
                                 "request to " + object_path + " failed");
    }

    if (len >= sizeof(resp)) {
        return BusReply::failure(BusErrorType::PROTOCOL_ERROR, "reply too large");
    }

    std::string reply(resp, len);
    spdlog::trace("[HostapdBus] {} -> {} bytes", object_path, len);
    return parse_control_reply(reply);
}

// ============================================================================
// Monitor connections (event loop thread)
// ============================================================================

std::string HostapdBusProxy::attach_monitor(Endpoint& ep) {
    ep.monitor = wpa_ctrl_open(ep.path.c_str());
    if (ep.monitor == nullptr) {
        return std::string("cannot open monitor connection: ") + std::strerror(errno);
    }

    if (wpa_ctrl_attach(ep.monitor) != 0) {
        wpa_ctrl_close(ep.monitor);
        ep.monitor = nullptr;
        return "failed to attach to hostapd events";
    }

    int monfd = wpa_ctrl_get_fd(ep.monitor);
    if (monfd < 0) {
        wpa_ctrl_close(ep.monitor);
        ep.monitor = nullptr;
        return "failed to get monitor socket file descriptor";
    }

    ep.monitor_io = hio_get(loop()->loop(), monfd);
    if (ep.monitor_io == nullptr) {
        wpa_ctrl_close(ep.monitor);
        ep.monitor = nullptr;
        return "failed to register monitor socket with libhv";
    }

    hio_set_context(ep.monitor_io, &ep);
    hio_setcb_read(ep.monitor_io, HostapdBusProxy::_handle_events);
    hio_setcb_close(ep.monitor_io, HostapdBusProxy::_handle_close);
    hio_read_start(ep.monitor_io);

    spdlog::debug("[HostapdBus] Monitoring events on {} (fd {})", ep.path, monfd);
    return "";
}

void HostapdBusProxy::detach_monitor(Endpoint& ep) {
    if (ep.monitor_io) {
        // Not a daemon-side close: no synthetic event
        hio_setcb_close(ep.monitor_io, nullptr);
        hio_read_stop(ep.monitor_io);
        hio_close(ep.monitor_io);
        ep.monitor_io = nullptr;
    }
    if (ep.monitor) {
        wpa_ctrl_detach(ep.monitor);
        wpa_ctrl_close(ep.monitor);
        ep.monitor = nullptr;
        spdlog::debug("[HostapdBus] Stopped monitoring {}", ep.path);
    }
}

SubscriptionId HostapdBusProxy::subscribe(const std::string& object_path,
                                          const std::string& interface,
                                          const std::string& signal_name, SignalHandler handler) {
    if (interface != INTERFACE_NAME || !handler) {
        return INVALID_SUBSCRIPTION_ID;
    }

    Endpoint& ep = endpoint(object_path);
    SubscriptionId id = INVALID_SUBSCRIPTION_ID;

    // Monitor lifetime and subscription bookkeeping both live on the loop thread
    run_in_loop_sync([&]() {
        if (ep.monitor == nullptr) {
            std::string err = attach_monitor(ep);
            if (!err.empty()) {
                spdlog::warn("[HostapdBus] Cannot subscribe to {}: {}", object_path, err);
                return;
            }
        }
        id = next_subscription_id_.fetch_add(1);
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_[id] = Subscription{object_path, signal_name, std::move(handler)};
    });

    if (id != INVALID_SUBSCRIPTION_ID) {
        spdlog::trace("[HostapdBus] Subscription {} to {} on {}", id, signal_name, object_path);
    }
    return id;
}

bool HostapdBusProxy::unsubscribe(SubscriptionId id) {
    bool found = false;

    run_in_loop_sync([&]() {
        std::string path;
        bool path_in_use = false;
        {
            std::lock_guard<std::mutex> lock(subscriptions_mutex_);
            auto it = subscriptions_.find(id);
            if (it == subscriptions_.end()) {
                return;
            }
            found = true;
            path = it->second.object_path;
            subscriptions_.erase(it);
            for (const auto& [other_id, sub] : subscriptions_) {
                if (sub.object_path == path) {
                    path_in_use = true;
                    break;
                }
            }
        }
        if (!path_in_use) {
            detach_monitor(endpoint(path));
        }
    });

    return found;
}

// ============================================================================
// Event delivery (event loop thread)
// ============================================================================

void HostapdBusProxy::deliver(const SignalPayload& payload) {
    std::vector<SignalHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (sub.object_path == payload.object_path &&
                (sub.signal_name == payload.name || sub.signal_name == ALL_SIGNALS)) {
                handlers.push_back(sub.handler);
            }
        }
    }

    if (handlers.empty()) {
        spdlog::trace("[HostapdBus] No subscriber for {} on {}", payload.name,
                      payload.object_path);
        return;
    }

    for (const auto& handler : handlers) {
        try {
            handler(payload);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[HostapdBus] Signal handler threw on {}: {}", payload.name,
                               e.what());
        }
    }
}

void HostapdBusProxy::handle_events(Endpoint& ep, void* data, int len) {
    if (data == nullptr || len <= 0) {
        LOG_WARN_INTERNAL("[HostapdBus] Received empty event on {}", ep.path);
        return;
    }

    std::string text(static_cast<char*>(data), len);
    spdlog::trace("[HostapdBus] Event on {}: {}", ep.path, text);

    auto payload = parse_control_event(ep.path, text);
    if (!payload) {
        LOG_WARN_INTERNAL("[HostapdBus] Unparseable event on {}: '{}'", ep.path, text);
        return;
    }
    deliver(*payload);
}

void HostapdBusProxy::_handle_events(hio_t* io, void* data, int readbyte) {
    // Static trampoline: Extract endpoint pointer and forward to member function
    auto* ep = static_cast<Endpoint*>(hio_context(io));
    if (ep && ep->owner) {
        ep->owner->handle_events(*ep, data, readbyte);
    } else {
        LOG_ERROR_INTERNAL("[HostapdBus] Read callback invoked with NULL context");
    }
}

void HostapdBusProxy::_handle_close(hio_t* io) {
    auto* ep = static_cast<Endpoint*>(hio_context(io));
    if (!ep || !ep->owner) {
        return;
    }

    spdlog::warn("[HostapdBus] Monitor connection to {} closed by the daemon", ep->path);
    ep->monitor_io = nullptr;
    if (ep->monitor) {
        wpa_ctrl_close(ep->monitor);
        ep->monitor = nullptr;
    }

    SignalPayload payload;
    payload.object_path = ep->path;
    payload.interface = INTERFACE_NAME;
    payload.name = "CTRL-EVENT-TERMINATING";
    payload.args = json{{"level", 0}, {"params", json::array({"monitor-closed"})},
                        {"fields", json::object()}};
    ep->owner->deliver(payload);
}

} // namespace proton
