// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon_object_model.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace proton {

namespace {

// hostapd macaddr_acl values
constexpr int ACL_ACCEPT_UNLESS_DENIED = 0;
constexpr int ACL_DENY_UNLESS_ACCEPTED = 1;

// ieee80211w values
constexpr int PMF_DISABLED = 0;
constexpr int PMF_OPTIONAL = 1;
constexpr int PMF_REQUIRED = 2;

/// Events that take the BSS down without an AP-DISABLED
const std::vector<std::string> FAULT_SIGNALS = {"INTERFACE-DISABLED", "CTRL-EVENT-TERMINATING",
                                                "ACS-FAILED", "DFS-RADAR-DETECTED"};

std::string to_hex(const std::string& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0f]);
    }
    return out;
}

bool is_raw_psk(const std::string& pass) {
    if (pass.size() != 64) {
        return false;
    }
    for (char c : pass) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::optional<long> parse_long(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

/// String field of a reply or signal, nullopt if missing or not a string
std::optional<std::string> string_field(const json& fields, const char* key) {
    if (!fields.is_object()) {
        return std::nullopt;
    }
    auto it = fields.find(key);
    if (it == fields.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// Member of a reply object, or null when absent
const json& member(const json& body, const char* key) {
    static const json null_value;
    if (!body.is_object()) {
        return null_value;
    }
    auto it = body.find(key);
    return it == body.end() ? null_value : *it;
}

std::string reply_status(const json& body) {
    if (!body.is_object()) {
        return "";
    }
    auto it = body.find("status");
    return (it != body.end() && it->is_string()) ? it->get<std::string>() : "";
}

} // namespace

const char* daemon_ap_state_name(DaemonApState state) {
    switch (state) {
    case DaemonApState::ENABLED:
        return "enabled";
    case DaemonApState::DISABLED:
        return "disabled";
    case DaemonApState::TRANSITIONAL:
        return "transitional";
    case DaemonApState::FAULT:
        return "fault";
    }
    return "unknown";
}

DaemonObjectModel::DaemonObjectModel(std::string control_dir)
    : control_dir_(std::move(control_dir)) {
    while (control_dir_.size() > 1 && control_dir_.back() == '/') {
        control_dir_.pop_back();
    }
}

std::string DaemonObjectModel::object_path(const std::string& handle) const {
    return control_dir_ + "/" + handle;
}

std::optional<std::string> DaemonObjectModel::handle_for_path(const std::string& path) const {
    const std::string prefix = control_dir_ + "/";
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    std::string handle = path.substr(prefix.size());
    if (handle.find('/') != std::string::npos) {
        return std::nullopt;
    }
    return handle;
}

// ============================================================================
// Requests
// ============================================================================

BusCall DaemonObjectModel::make_call(const std::string& handle, const std::string& method,
                                     std::vector<std::string> args, bool sensitive) const {
    BusCall call;
    call.object_path = object_path(handle);
    call.interface = INTERFACE;
    call.method = method;
    call.sensitive = sensitive;

    call.description = method;
    for (size_t i = 0; i < args.size(); ++i) {
        // SET <field> <secret>: keep the field name, hide the value
        bool redact = sensitive && i + 1 == args.size() && i > 0;
        call.description += " " + (redact ? std::string("[REDACTED]") : args[i]);
    }

    call.args = json(std::move(args));
    return call;
}

std::vector<BusCall> DaemonObjectModel::set_configuration(const std::string& handle,
                                                          const AccessPointConfig& config) const {
    std::vector<BusCall> calls;
    auto set = [&](const std::string& field, const std::string& value, bool sensitive = false) {
        calls.push_back(make_call(handle, "SET", {field, value}, sensitive));
    };

    // ssid2 takes hex so that any octet survives the text protocol
    set("ssid2", to_hex(config.ssid));

    switch (config.security) {
    case SecurityMode::OPEN:
        set("wpa", "0");
        set("ieee80211w", std::to_string(PMF_DISABLED));
        break;
    case SecurityMode::WPA2_PERSONAL:
        set("wpa", "2");
        set("wpa_key_mgmt", "WPA-PSK");
        set("rsn_pairwise", "CCMP");
        if (is_raw_psk(config.passphrase)) {
            set("wpa_psk", config.passphrase, true);
        } else {
            set("wpa_passphrase", config.passphrase, true);
        }
        set("ieee80211w", std::to_string(PMF_DISABLED));
        break;
    case SecurityMode::WPA3_PERSONAL:
        set("wpa", "2");
        set("wpa_key_mgmt", "SAE");
        set("rsn_pairwise", "CCMP");
        set("sae_password", config.passphrase, true);
        set("ieee80211w", std::to_string(PMF_REQUIRED));
        break;
    case SecurityMode::WPA2_WPA3_MIXED:
        set("wpa", "2");
        set("wpa_key_mgmt", "WPA-PSK SAE");
        set("rsn_pairwise", "CCMP");
        set("wpa_passphrase", config.passphrase, true);
        set("sae_password", config.passphrase, true);
        set("ieee80211w", std::to_string(PMF_OPTIONAL));
        break;
    }

    set("hw_mode", config.band == Band::BAND_5GHZ ? "a" : "g");
    set("channel", std::to_string(config.channel)); // 0 = ACS
    set("ap_isolate", config.client_isolation ? "1" : "0");

    const MacPolicy& policy = config.mac_policy;
    set("macaddr_acl", std::to_string(policy.mode() == MacPolicy::Mode::WHITELIST
                                          ? ACL_DENY_UNLESS_ACCEPTED
                                          : ACL_ACCEPT_UNLESS_DENIED));
    calls.push_back(make_call(handle, "ACCEPT_ACL", {"CLEAR"}));
    calls.push_back(make_call(handle, "DENY_ACL", {"CLEAR"}));

    const char* acl_method = policy.mode() == MacPolicy::Mode::WHITELIST ? "ACCEPT_ACL" : "DENY_ACL";
    for (const auto& mac : policy.addresses()) {
        calls.push_back(make_call(handle, acl_method, {"ADD_MAC", mac.to_string()}));
    }

    return calls;
}

BusCall DaemonObjectModel::start_ap(const std::string& handle) const {
    return make_call(handle, "ENABLE", {});
}

BusCall DaemonObjectModel::stop_ap(const std::string& handle) const {
    return make_call(handle, "DISABLE", {});
}

BusCall DaemonObjectModel::query_state(const std::string& handle) const {
    return make_call(handle, "STATUS", {});
}

BusCall DaemonObjectModel::first_station(const std::string& handle) const {
    return make_call(handle, "STA-FIRST", {});
}

BusCall DaemonObjectModel::next_station(const std::string& handle,
                                        const MacAddress& previous) const {
    return make_call(handle, "STA-NEXT", {previous.to_string()});
}

BusCall DaemonObjectModel::deauthenticate(const std::string& handle,
                                          const MacAddress& station) const {
    return make_call(handle, "DEAUTHENTICATE", {station.to_string()});
}

const std::vector<std::string>& DaemonObjectModel::signal_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> n = {"AP-ENABLED", "AP-DISABLED", "AP-STA-CONNECTED",
                                      "AP-STA-DISCONNECTED"};
        n.insert(n.end(), FAULT_SIGNALS.begin(), FAULT_SIGNALS.end());
        return n;
    }();
    return names;
}

// ============================================================================
// Replies
// ============================================================================

DaemonApState DaemonObjectModel::parse_daemon_state(const std::string& raw) {
    if (raw == "ENABLED") {
        return DaemonApState::ENABLED;
    }
    if (raw == "DISABLED" || raw == "UNINITIALIZED") {
        return DaemonApState::DISABLED;
    }
    if (raw == "UNKNOWN") {
        return DaemonApState::FAULT;
    }
    return DaemonApState::TRANSITIONAL;
}

ApError DaemonObjectModel::decode_ack(const json& body) {
    std::string status = reply_status(body);
    if (status == "OK") {
        return ApError::ok();
    }
    return ApError::decode_error("expected OK acknowledgment, got " +
                                 (body.is_null() ? std::string("nothing") : body.dump()));
}

ApError DaemonObjectModel::decode_status(const json& body, DaemonStatus& out) {
    if (reply_status(body) != "DATA") {
        return ApError::decode_error("STATUS reply carries no data");
    }

    const json& fields = member(body, "fields");
    auto state = string_field(fields, "state");
    if (!state) {
        return ApError::decode_error("STATUS reply has no 'state' field");
    }

    DaemonStatus status;
    status.raw_state = *state;
    status.state = parse_daemon_state(*state);
    status.ssid = string_field(fields, "ssid[0]").value_or("");

    if (auto ch = string_field(fields, "channel")) {
        auto value = parse_long(*ch);
        if (!value) {
            return ApError::decode_error("STATUS 'channel' is not a number: " + *ch);
        }
        status.channel = static_cast<int>(*value);
    }
    if (auto n = string_field(fields, "num_sta[0]")) {
        status.station_count = static_cast<int>(parse_long(*n).value_or(0));
    }

    out = std::move(status);
    return ApError::ok();
}

ApError DaemonObjectModel::decode_station(const json& body, std::optional<Station>& out) {
    std::string status = reply_status(body);
    if (status == "EMPTY") {
        out.reset();
        return ApError::ok();
    }
    if (status != "DATA") {
        return ApError::decode_error("station reply carries no data");
    }

    const json& lines = member(body, "lines");
    if (!lines.is_array() || lines.empty() || !lines[0].is_string()) {
        return ApError::decode_error("station reply has no address line");
    }

    auto mac = MacAddress::parse(lines[0].get<std::string>());
    if (!mac) {
        return ApError::decode_error("station reply starts with '" + lines[0].get<std::string>() +
                                     "', not a MAC address");
    }

    Station station;
    station.mac = *mac;
    station.associated_at = std::chrono::system_clock::now();

    const json& fields = member(body, "fields");
    if (auto sig = string_field(fields, "signal")) {
        if (auto v = parse_long(*sig)) {
            station.signal_dbm = static_cast<int>(*v);
        }
    }
    if (auto ct = string_field(fields, "connected_time")) {
        auto v = parse_long(*ct);
        if (v && *v >= 0 && *v <= std::numeric_limits<uint32_t>::max()) {
            station.connected_seconds = static_cast<uint32_t>(*v);
            station.associated_at -= std::chrono::seconds(*v);
        }
    }

    out = station;
    return ApError::ok();
}

ApError DaemonObjectModel::decode_signal(const SignalPayload& payload, DaemonSignal& out) const {
    auto handle = handle_for_path(payload.object_path);
    if (!handle) {
        return ApError::decode_error("signal from unknown object " + payload.object_path);
    }
    if (!payload.args.is_object()) {
        return ApError::decode_error(payload.name + " arguments are not an object");
    }

    const json& params = member(payload.args, "params");
    if (!params.is_null() && !params.is_array()) {
        return ApError::decode_error(payload.name + " params are not a list");
    }

    DaemonSignal sig;
    sig.handle = *handle;
    sig.name = payload.name;

    if (payload.name == "AP-ENABLED" || payload.name == "AP-DISABLED") {
        sig.kind = DaemonSignal::Kind::STATE_CHANGED;
        sig.state =
            payload.name == "AP-ENABLED" ? DaemonApState::ENABLED : DaemonApState::DISABLED;
    } else if (payload.name == "AP-STA-CONNECTED" || payload.name == "AP-STA-DISCONNECTED") {
        if (!params.is_array() || params.empty() || !params[0].is_string()) {
            return ApError::decode_error(payload.name + " without station address");
        }
        auto mac = MacAddress::parse(params[0].get<std::string>());
        if (!mac) {
            return ApError::decode_error(payload.name + " with invalid station address '" +
                                         params[0].get<std::string>() + "'");
        }
        sig.kind = payload.name == "AP-STA-CONNECTED" ? DaemonSignal::Kind::STATION_ADDED
                                                      : DaemonSignal::Kind::STATION_REMOVED;
        Station station;
        station.mac = *mac;
        station.associated_at = std::chrono::system_clock::now();
        sig.station = station;
    } else if (std::find(FAULT_SIGNALS.begin(), FAULT_SIGNALS.end(), payload.name) !=
               FAULT_SIGNALS.end()) {
        sig.kind = DaemonSignal::Kind::STATE_CHANGED;
        sig.state = DaemonApState::FAULT;
        sig.reason = "daemon reported " + payload.name;
        // The daemon closes every monitor socket when it terminates
        sig.stream_ended = payload.name == "CTRL-EVENT-TERMINATING";
        std::string detail;
        for (const auto& p : params.is_array() ? params : json::array()) {
            if (p.is_string()) {
                detail += (detail.empty() ? "" : " ") + p.get<std::string>();
            }
        }
        if (!detail.empty()) {
            sig.reason += " (" + detail + ")";
        }
    } else if (payload.name == "DFS-NOP-FINISHED" || payload.name == "AP-CSA-FINISHED") {
        sig.kind = DaemonSignal::Kind::IGNORED;
    } else {
        return ApError::decode_error("unexpected signal " + payload.name);
    }

    out = std::move(sig);
    return ApError::ok();
}

} // namespace proton
