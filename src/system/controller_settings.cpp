// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "controller_settings.h"

#include <algorithm>

namespace proton {

ControllerSettings ControllerSettings::from_config(const Config& config) {
    ControllerSettings s;

    s.operation_timeout = std::chrono::milliseconds(std::max(
        1, config.get<int>("/controller/operation_timeout_ms",
                           static_cast<int>(s.operation_timeout.count()))));
    s.retry_attempts =
        std::max(1, config.get<int>("/controller/retry_attempts", s.retry_attempts));
    s.retry_backoff = std::chrono::milliseconds(std::max(
        0, config.get<int>("/controller/retry_backoff_ms",
                           static_cast<int>(s.retry_backoff.count()))));
    s.retry_backoff_max = std::chrono::milliseconds(std::max(
        static_cast<int>(s.retry_backoff.count()),
        config.get<int>("/controller/retry_backoff_max_ms",
                        static_cast<int>(s.retry_backoff_max.count()))));
    s.observer_queue_capacity = static_cast<size_t>(std::max(
        1, config.get<int>("/controller/observer_queue_capacity",
                           static_cast<int>(s.observer_queue_capacity))));
    s.control_dir = config.get<std::string>("/hostapd/control_dir", s.control_dir);

    spdlog::debug("[Settings] timeout={}ms retries={} backoff={}..{}ms queue={} control_dir={}",
                  s.operation_timeout.count(), s.retry_attempts, s.retry_backoff.count(),
                  s.retry_backoff_max.count(), s.observer_queue_capacity, s.control_dir);
    return s;
}

ApError parse_access_point_config(const json& obj, AccessPointConfig& out) {
    if (!obj.is_object()) {
        return ApError::invalid_config("access point configuration must be a JSON object");
    }

    AccessPointConfig cfg;

    if (!obj.contains("ssid") || !obj["ssid"].is_string()) {
        return ApError::invalid_config("'ssid' must be a string");
    }
    cfg.ssid = obj["ssid"].get<std::string>();

    if (obj.contains("security")) {
        if (!obj["security"].is_string()) {
            return ApError::invalid_config("'security' must be a string");
        }
        auto mode = parse_security_mode(obj["security"].get<std::string>());
        if (!mode) {
            return ApError::invalid_config("unknown security mode '" +
                                           obj["security"].get<std::string>() + "'");
        }
        cfg.security = *mode;
    }

    if (obj.contains("passphrase")) {
        if (!obj["passphrase"].is_string()) {
            return ApError::invalid_config("'passphrase' must be a string");
        }
        cfg.passphrase = obj["passphrase"].get<std::string>();
    }

    if (obj.contains("band")) {
        if (obj["band"].is_string()) {
            cfg.band = parse_band(obj["band"].get<std::string>());
        } else if (obj["band"].is_number()) {
            cfg.band = obj["band"].get<double>() >= 5.0 ? Band::BAND_5GHZ : Band::BAND_2_4GHZ;
        } else {
            return ApError::invalid_config("'band' must be \"2.4\" or \"5\"");
        }
    }

    if (obj.contains("channel")) {
        if (!obj["channel"].is_number_integer()) {
            return ApError::invalid_config("'channel' must be an integer");
        }
        cfg.channel = obj["channel"].get<int>();
    }

    if (obj.contains("client_isolation")) {
        if (!obj["client_isolation"].is_boolean()) {
            return ApError::invalid_config("'client_isolation' must be a boolean");
        }
        cfg.client_isolation = obj["client_isolation"].get<bool>();
    }

    if (obj.contains("mac_policy")) {
        const json& policy = obj["mac_policy"];
        if (!policy.is_object() || !policy.contains("mode") || !policy["mode"].is_string()) {
            return ApError::invalid_config("'mac_policy' must be an object with a 'mode'");
        }
        auto mode = parse_mac_policy_mode(policy["mode"].get<std::string>());
        if (!mode) {
            return ApError::invalid_config("unknown MAC policy mode '" +
                                           policy["mode"].get<std::string>() + "'");
        }

        switch (*mode) {
        case MacPolicy::Mode::PUBLIC:
            cfg.mac_policy = MacPolicy::make_public();
            break;
        case MacPolicy::Mode::WHITELIST:
            cfg.mac_policy = MacPolicy::make_whitelist();
            break;
        case MacPolicy::Mode::BLACKLIST:
            cfg.mac_policy = MacPolicy::make_blacklist();
            break;
        }

        if (policy.contains("addresses")) {
            if (!policy["addresses"].is_array()) {
                return ApError::invalid_config("'mac_policy.addresses' must be an array");
            }
            for (const auto& entry : policy["addresses"]) {
                auto mac = entry.is_string() ? MacAddress::parse(entry.get<std::string>())
                                             : std::nullopt;
                if (!mac) {
                    return ApError::invalid_config("invalid MAC address in mac_policy: " +
                                                   entry.dump());
                }
                bool added = (*mode == MacPolicy::Mode::WHITELIST) ? cfg.mac_policy.allow(*mac)
                                                                   : cfg.mac_policy.deny(*mac);
                if (!added) {
                    return ApError::invalid_config("public MAC policy cannot list addresses");
                }
            }
        }
    }

    out = std::move(cfg);
    return ApError::ok();
}

} // namespace proton
