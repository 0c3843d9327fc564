// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mac_address.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace proton {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

} // namespace

std::optional<MacAddress> MacAddress::parse(const std::string& text) {
    // Exactly "xx?xx?xx?xx?xx?xx" where ? is ':' or '-'
    if (text.size() != 17) {
        return std::nullopt;
    }

    std::array<uint8_t, 6> octets{};
    for (size_t i = 0; i < 6; ++i) {
        size_t pos = i * 3;
        int hi = hex_value(text[pos]);
        int lo = hex_value(text[pos + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        if (i < 5 && text[pos + 2] != ':' && text[pos + 2] != '-') {
            return std::nullopt;
        }
        octets[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return MacAddress(octets);
}

std::string MacAddress::to_string() const {
    char buf[18];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", octets_[0], octets_[1],
             octets_[2], octets_[3], octets_[4], octets_[5]);
    return std::string(buf);
}

bool MacAddress::is_zero() const {
    return std::all_of(octets_.begin(), octets_.end(), [](uint8_t o) { return o == 0x00; });
}

bool MacAddress::is_broadcast() const {
    return std::all_of(octets_.begin(), octets_.end(), [](uint8_t o) { return o == 0xff; });
}

// ============================================================================
// MacPolicy
// ============================================================================

bool MacPolicy::allow(const MacAddress& mac) {
    if (mode_ != Mode::WHITELIST) {
        return false;
    }
    if (!contains(mac)) {
        addresses_.push_back(mac);
    }
    return true;
}

bool MacPolicy::deny(const MacAddress& mac) {
    if (mode_ != Mode::BLACKLIST) {
        return false;
    }
    if (!contains(mac)) {
        addresses_.push_back(mac);
    }
    return true;
}

bool MacPolicy::check(const MacAddress& mac) const {
    switch (mode_) {
    case Mode::PUBLIC:
        return true;
    case Mode::WHITELIST:
        return contains(mac);
    case Mode::BLACKLIST:
        return !contains(mac);
    }
    return false;
}

bool MacPolicy::contains(const MacAddress& mac) const {
    return std::find(addresses_.begin(), addresses_.end(), mac) != addresses_.end();
}

const char* mac_policy_mode_name(MacPolicy::Mode mode) {
    switch (mode) {
    case MacPolicy::Mode::PUBLIC:
        return "public";
    case MacPolicy::Mode::WHITELIST:
        return "whitelist";
    case MacPolicy::Mode::BLACKLIST:
        return "blacklist";
    }
    return "unknown";
}

std::optional<MacPolicy::Mode> parse_mac_policy_mode(const std::string& str) {
    if (str == "public")
        return MacPolicy::Mode::PUBLIC;
    if (str == "whitelist")
        return MacPolicy::Mode::WHITELIST;
    if (str == "blacklist")
        return MacPolicy::Mode::BLACKLIST;
    return std::nullopt;
}

} // namespace proton
