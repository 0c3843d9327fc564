// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ap_types.h"

#include <algorithm>
#include <cctype>

namespace proton {

namespace {

bool is_printable_ascii(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= 32 && c < 127; });
}

bool is_hex_string(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

ApError validate_passphrase(const AccessPointConfig& config) {
    const std::string& pass = config.passphrase;

    switch (config.security) {
    case SecurityMode::OPEN:
        if (!pass.empty()) {
            return ApError::invalid_config("open network must not carry a passphrase");
        }
        return ApError::ok();

    case SecurityMode::WPA2_PERSONAL:
        // 64 hex digits is a raw PSK
        if (pass.size() == 64 && is_hex_string(pass)) {
            return ApError::ok();
        }
        if (pass.size() < 8 || pass.size() > 63) {
            return ApError::invalid_config("WPA2 passphrase must be 8-63 characters, got " +
                                           std::to_string(pass.size()));
        }
        break;

    case SecurityMode::WPA3_PERSONAL:
        if (pass.size() < 8 || pass.size() > 128) {
            return ApError::invalid_config("WPA3 password must be 8-128 characters, got " +
                                           std::to_string(pass.size()));
        }
        break;

    case SecurityMode::WPA2_WPA3_MIXED:
        // SAE needs the password itself, so a raw PSK is not enough
        if (pass.size() < 8 || pass.size() > 63) {
            return ApError::invalid_config("WPA2/WPA3 passphrase must be 8-63 characters, got " +
                                           std::to_string(pass.size()));
        }
        break;
    }

    if (!is_printable_ascii(pass)) {
        return ApError::invalid_config("passphrase contains non-printable characters");
    }
    return ApError::ok();
}

} // namespace

ApError validate_config(const AccessPointConfig& config) {
    if (config.ssid.empty()) {
        return ApError::invalid_config("SSID must not be empty");
    }
    if (config.ssid.size() > MAX_SSID_LENGTH) {
        return ApError::invalid_config("SSID exceeds 32 bytes (" +
                                       std::to_string(config.ssid.size()) + ")");
    }

    ApError pass_result = validate_passphrase(config);
    if (!pass_result) {
        return pass_result;
    }

    if (!is_valid_channel(config.band, config.channel)) {
        return ApError::invalid_config("channel " + std::to_string(config.channel) +
                                       " is not valid for the " + band_name(config.band) +
                                       " band");
    }

    if (config.mac_policy.mode() == MacPolicy::Mode::WHITELIST &&
        config.mac_policy.addresses().empty()) {
        return ApError::invalid_config("whitelist policy without addresses admits nobody");
    }

    return ApError::ok();
}

bool security_requires_passphrase(SecurityMode security) {
    return security != SecurityMode::OPEN;
}

bool is_valid_channel(Band band, int channel) {
    if (channel == 0) {
        return true;
    }
    if (band == Band::BAND_2_4GHZ) {
        return channel >= 1 && channel <= 14;
    }
    // UNII-1/2 (36-64), UNII-2e (100-144), UNII-3 (149-165)
    if (channel >= 36 && channel <= 64) {
        return channel % 4 == 0;
    }
    if (channel >= 100 && channel <= 144) {
        return channel % 4 == 0;
    }
    if (channel >= 149 && channel <= 165) {
        return (channel - 149) % 4 == 0;
    }
    return false;
}

const char* security_mode_name(SecurityMode mode) {
    switch (mode) {
    case SecurityMode::OPEN:
        return "open";
    case SecurityMode::WPA2_PERSONAL:
        return "wpa2";
    case SecurityMode::WPA3_PERSONAL:
        return "wpa3";
    case SecurityMode::WPA2_WPA3_MIXED:
        return "mixed";
    }
    return "unknown";
}

const char* band_name(Band band) {
    switch (band) {
    case Band::BAND_2_4GHZ:
        return "2.4GHz";
    case Band::BAND_5GHZ:
        return "5GHz";
    }
    return "unknown";
}

std::optional<SecurityMode> parse_security_mode(const std::string& str) {
    if (str == "open")
        return SecurityMode::OPEN;
    if (str == "wpa2")
        return SecurityMode::WPA2_PERSONAL;
    if (str == "wpa3")
        return SecurityMode::WPA3_PERSONAL;
    if (str == "mixed")
        return SecurityMode::WPA2_WPA3_MIXED;
    return std::nullopt;
}

Band parse_band(const std::string& str) {
    if (str == "5" || str == "5GHz") {
        return Band::BAND_5GHZ;
    }
    return Band::BAND_2_4GHZ;
}

const char* lifecycle_state_name(LifecycleState state) {
    switch (state) {
    case LifecycleState::DOWN:
        return "Down";
    case LifecycleState::CONFIGURING:
        return "Configuring";
    case LifecycleState::STARTING:
        return "Starting";
    case LifecycleState::UP:
        return "Up";
    case LifecycleState::STOPPING:
        return "Stopping";
    case LifecycleState::ERROR:
        return "Error";
    }
    return "Unknown";
}

bool AccessPointSnapshot::has_station(const MacAddress& mac) const {
    return std::any_of(stations.begin(), stations.end(),
                       [&mac](const Station& s) { return s.mac == mac; });
}

} // namespace proton
