// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bus_proxy_mock.h"

#include "error_reporting.h"

#include <algorithm>

namespace proton {

namespace {

std::string join_command(const std::string& method, const std::vector<std::string>& args) {
    std::string cmd = method;
    for (const auto& a : args) {
        cmd += " " + a;
    }
    return cmd;
}

std::string from_hex(const std::string& hex) {
    std::string out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

json ok_body() {
    return json{{"status", "OK"}, {"fields", json::object()}, {"lines", json::array()}};
}

json empty_body() {
    return json{{"status", "EMPTY"}, {"fields", json::object()}, {"lines", json::array()}};
}

} // namespace

BusProxyMock::BusProxyMock() {
    worker_ = std::thread(&BusProxyMock::worker_loop, this);
    spdlog::debug("[BusProxyMock] Simulated hostapd started");
}

BusProxyMock::~BusProxyMock() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::trace("[BusProxyMock] Destroyed");
}

// ============================================================================
// BusProxy interface
// ============================================================================

BusReply BusProxyMock::call(const std::string& object_path, const std::string& interface,
                            const std::string& method, const json& args) {
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = call_delay_;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::vector<std::string> str_args;
    if (args.is_array()) {
        for (const auto& a : args) {
            if (!a.is_string()) {
                return BusReply::failure(BusErrorType::PROTOCOL_ERROR,
                                         "argument is not a string: " + a.dump());
            }
            str_args.push_back(a.get<std::string>());
        }
    } else if (!args.is_null()) {
        return BusReply::failure(BusErrorType::PROTOCOL_ERROR, "arguments are not a list");
    }

    std::string command = join_command(method, str_args);

    std::lock_guard<std::mutex> lock(mutex_);
    call_log_.push_back(command);

    if (interface != "hostapd") {
        return BusReply::failure(BusErrorType::REMOTE_ERROR, "UNKNOWN COMMAND");
    }

    if (fail_remaining_ > 0) {
        --fail_remaining_;
        spdlog::debug("[BusProxyMock] Injected {} for {}", bus_error_name(fail_type_), method);
        return BusReply::failure(fail_type_, std::string("injected ") + bus_error_name(fail_type_));
    }

    for (const auto& [prefix, reason] : rejections_) {
        if (command.compare(0, prefix.size(), prefix) == 0) {
            spdlog::debug("[BusProxyMock] Rejecting {}: {}", method, reason);
            return BusReply::failure(BusErrorType::REMOTE_ERROR, reason);
        }
    }

    return handle_command(object_path, method, str_args);
}

SubscriptionId BusProxyMock::subscribe(const std::string& object_path,
                                       const std::string& interface,
                                       const std::string& signal_name, SignalHandler handler) {
    if (interface != "hostapd" || !handler) {
        return INVALID_SUBSCRIPTION_ID;
    }
    SubscriptionId id = next_subscription_id_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_[id] = Subscription{object_path, signal_name, std::move(handler)};
    if (closed_monitors_.erase(object_path) > 0) {
        spdlog::debug("[BusProxyMock] Monitor on {} reopened", object_path);
    }
    spdlog::trace("[BusProxyMock] Subscription {} to {} on {}", id, signal_name, object_path);
    return id;
}

bool BusProxyMock::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

// ============================================================================
// Simulated daemon (mutex_ held)
// ============================================================================

BusReply BusProxyMock::handle_command(const std::string& path, const std::string& method,
                                      const std::vector<std::string>& args) {
    SimulatedAp& ap = aps_[path];

    if (method == "SET") {
        if (args.size() != 2) {
            return BusReply::failure(BusErrorType::REMOTE_ERROR, "FAIL");
        }
        ap.fields[args[0]] = args[1];
        return BusReply::success(ok_body());
    }

    if (method == "ACCEPT_ACL" || method == "DENY_ACL") {
        auto& list = method == "ACCEPT_ACL" ? ap.accept_acl : ap.deny_acl;
        if (args.size() == 1 && args[0] == "CLEAR") {
            list.clear();
            return BusReply::success(ok_body());
        }
        if (args.size() == 2 && args[0] == "ADD_MAC") {
            auto mac = MacAddress::parse(args[1]);
            if (!mac) {
                return BusReply::failure(BusErrorType::REMOTE_ERROR, "FAIL");
            }
            if (std::find(list.begin(), list.end(), *mac) == list.end()) {
                list.push_back(*mac);
            }
            return BusReply::success(ok_body());
        }
        return BusReply::failure(BusErrorType::REMOTE_ERROR, "FAIL");
    }

    if (method == "ENABLE") {
        if (ap.state == "ENABLED") {
            return BusReply::failure(BusErrorType::REMOTE_ERROR, "FAIL");
        }
        if (auto_confirm_) {
            SignalPayload p{path, "hostapd", "AP-ENABLED",
                            json{{"level", 3}, {"params", json::array()}, {"fields", json::object()}}};
            schedule(std::move(p), confirm_delay_);
        }
        return BusReply::success(ok_body());
    }

    if (method == "DISABLE") {
        if (auto_confirm_) {
            SignalPayload p{path, "hostapd", "AP-DISABLED",
                            json{{"level", 3}, {"params", json::array()}, {"fields", json::object()}}};
            schedule(std::move(p), confirm_delay_);
        }
        return BusReply::success(ok_body());
    }

    if (method == "DEAUTHENTICATE") {
        auto mac = args.size() == 1 ? MacAddress::parse(args[0]) : std::nullopt;
        if (!mac) {
            return BusReply::failure(BusErrorType::REMOTE_ERROR, "FAIL");
        }
        // hostapd acknowledges unknown stations too; only associated ones leave
        if (auto_confirm_ && ap.stations.count(*mac) > 0) {
            SignalPayload p{path, "hostapd", "AP-STA-DISCONNECTED",
                            json{{"level", 3},
                                 {"params", json::array({mac->to_string()})},
                                 {"fields", json::object()}}};
            schedule(std::move(p), confirm_delay_);
        }
        return BusReply::success(ok_body());
    }

    if (method == "STATUS") {
        json fields = {{"state", ap.state},
                       {"channel", ap.fields.count("channel") ? ap.fields["channel"] : "0"},
                       {"num_sta[0]", std::to_string(ap.stations.size())}};
        if (ap.fields.count("ssid2")) {
            fields["ssid[0]"] = from_hex(ap.fields["ssid2"]);
        }
        return BusReply::success(
            json{{"status", "DATA"}, {"fields", fields}, {"lines", json::array()}});
    }

    if (method == "STA-FIRST") {
        if (ap.stations.empty()) {
            return BusReply::success(empty_body());
        }
        auto it = ap.stations.begin();
        return station_reply(path, it->first, it->second);
    }

    if (method == "STA-NEXT") {
        auto prev = args.size() == 1 ? MacAddress::parse(args[0]) : std::nullopt;
        if (!prev || ap.stations.count(*prev) == 0) {
            return BusReply::failure(BusErrorType::REMOTE_ERROR, "FAIL");
        }
        auto it = ap.stations.upper_bound(*prev);
        if (it == ap.stations.end()) {
            return BusReply::success(empty_body());
        }
        return station_reply(path, it->first, it->second);
    }

    return BusReply::failure(BusErrorType::REMOTE_ERROR, "UNKNOWN COMMAND");
}

BusReply BusProxyMock::station_reply(const std::string& /*path*/, const MacAddress& mac,
                                     const std::optional<int>& signal_dbm) const {
    json fields = {{"flags", "[AUTH][ASSOC][AUTHORIZED]"}, {"connected_time", "1"}};
    if (signal_dbm) {
        fields["signal"] = std::to_string(*signal_dbm);
    }
    return BusReply::success(
        json{{"status", "DATA"}, {"fields", fields}, {"lines", json::array({mac.to_string()})}});
}

void BusProxyMock::apply_signal(const SignalPayload& payload) {
    SimulatedAp& ap = aps_[payload.object_path];
    const json& params = payload.args.contains("params") ? payload.args["params"] : json::array();

    if (payload.name == "AP-ENABLED") {
        ap.state = "ENABLED";
    } else if (payload.name == "AP-DISABLED" || payload.name == "INTERFACE-DISABLED" ||
               payload.name == "CTRL-EVENT-TERMINATING" || payload.name == "ACS-FAILED") {
        ap.state = "DISABLED";
        ap.stations.clear();
    } else if (payload.name == "AP-STA-CONNECTED" && params.is_array() && !params.empty() &&
               params[0].is_string()) {
        if (auto mac = MacAddress::parse(params[0].get<std::string>())) {
            ap.stations.emplace(*mac, std::nullopt);
        }
    } else if (payload.name == "AP-STA-DISCONNECTED" && params.is_array() && !params.empty() &&
               params[0].is_string()) {
        if (auto mac = MacAddress::parse(params[0].get<std::string>())) {
            ap.stations.erase(*mac);
        }
    }
}

void BusProxyMock::schedule(SignalPayload payload, std::chrono::milliseconds delay) {
    queue_.emplace(std::chrono::steady_clock::now() + delay, std::move(payload));
    queue_cv_.notify_all();
}

// ============================================================================
// Signal worker
// ============================================================================

void BusProxyMock::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (queue_.empty()) {
            idle_cv_.notify_all();
            queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            continue;
        }

        auto due = queue_.begin()->first;
        if (std::chrono::steady_clock::now() < due) {
            queue_cv_.wait_until(lock, due);
            continue;
        }

        SignalPayload payload = std::move(queue_.begin()->second);
        queue_.erase(queue_.begin());
        apply_signal(payload);

        std::vector<SignalHandler> handlers;
        if (closed_monitors_.count(payload.object_path) == 0) {
            for (const auto& [id, sub] : subscriptions_) {
                if (sub.object_path == payload.object_path &&
                    (sub.signal_name == payload.name || sub.signal_name == ALL_SIGNALS)) {
                    handlers.push_back(sub.handler);
                }
            }
        }
        if (payload.name == "CTRL-EVENT-TERMINATING") {
            closed_monitors_.insert(payload.object_path);
        }

        delivering_ = true;
        lock.unlock();

        spdlog::trace("[BusProxyMock] Delivering {} on {} to {} handler(s)", payload.name,
                      payload.object_path, handlers.size());
        for (const auto& handler : handlers) {
            try {
                handler(payload);
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("[BusProxyMock] Signal handler threw on {}: {}", payload.name,
                                   e.what());
            }
        }

        lock.lock();
        delivering_ = false;
    }
    idle_cv_.notify_all();
}

// ============================================================================
// Behavior controls and inspection
// ============================================================================

void BusProxyMock::set_auto_confirm(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_confirm_ = enabled;
}

void BusProxyMock::set_confirm_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    confirm_delay_ = delay;
}

void BusProxyMock::set_call_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    call_delay_ = delay;
}

void BusProxyMock::fail_next_calls(int count, BusErrorType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_remaining_ = count;
    fail_type_ = type;
}

void BusProxyMock::reject_command(const std::string& command_prefix, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejections_.emplace_back(command_prefix, reason);
}

void BusProxyMock::clear_rejections() {
    std::lock_guard<std::mutex> lock(mutex_);
    rejections_.clear();
}

void BusProxyMock::emit_signal(const std::string& object_path, const std::string& name,
                               const std::vector<std::string>& params, const json& fields,
                               std::chrono::milliseconds delay) {
    SignalPayload p{object_path, "hostapd", name,
                    json{{"level", 3},
                         {"params", params},
                         {"fields", fields.is_null() ? json::object() : fields}}};
    std::lock_guard<std::mutex> lock(mutex_);
    schedule(std::move(p), delay);
}

void BusProxyMock::drop_monitor(const std::string& object_path,
                                std::chrono::milliseconds delay) {
    emit_signal(object_path, "CTRL-EVENT-TERMINATING", {"monitor-closed"}, json(), delay);
}

bool BusProxyMock::monitor_open(const std::string& object_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_monitors_.count(object_path) == 0;
}

void BusProxyMock::set_daemon_state(const std::string& object_path, const std::string& raw_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    aps_[object_path].state = raw_state;
}

void BusProxyMock::add_station(const std::string& object_path, const MacAddress& mac,
                               std::optional<int> signal_dbm) {
    std::lock_guard<std::mutex> lock(mutex_);
    aps_[object_path].stations[mac] = signal_dbm;
}

std::string BusProxyMock::daemon_state(const std::string& object_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aps_.find(object_path);
    return it == aps_.end() ? "DISABLED" : it->second.state;
}

std::string BusProxyMock::daemon_field(const std::string& object_path,
                                       const std::string& field) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aps_.find(object_path);
    if (it == aps_.end()) {
        return "";
    }
    auto f = it->second.fields.find(field);
    return f == it->second.fields.end() ? "" : f->second;
}

std::vector<MacAddress> BusProxyMock::accept_list(const std::string& object_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aps_.find(object_path);
    return it == aps_.end() ? std::vector<MacAddress>{} : it->second.accept_acl;
}

std::vector<MacAddress> BusProxyMock::deny_list(const std::string& object_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aps_.find(object_path);
    return it == aps_.end() ? std::vector<MacAddress>{} : it->second.deny_acl;
}

int BusProxyMock::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(call_log_.size());
}

int BusProxyMock::call_count(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(call_log_.begin(), call_log_.end(),
                                          [&](const std::string& cmd) {
                                              return cmd == method ||
                                                     cmd.compare(0, method.size() + 1,
                                                                 method + " ") == 0;
                                          }));
}

std::vector<std::string> BusProxyMock::call_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_log_;
}

void BusProxyMock::reset_calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    call_log_.clear();
}

size_t BusProxyMock::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

bool BusProxyMock::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !delivering_; });
}

} // namespace proton
