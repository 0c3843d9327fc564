// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ap_events.h"

#include <spdlog/fmt/fmt.h>

namespace proton {

const char* ap_event_type_name(ApEventType type) {
    switch (type) {
    case ApEventType::CLIENT_JOINED:
        return "ClientJoined";
    case ApEventType::CLIENT_LEFT:
        return "ClientLeft";
    case ApEventType::STATE_CHANGED:
        return "StateChanged";
    case ApEventType::CONFIGURATION_FAILED:
        return "ConfigurationFailed";
    }
    return "Unknown";
}

ApEvent ApEvent::client_joined(const std::string& handle, const Station& station) {
    ApEvent e;
    e.type = ApEventType::CLIENT_JOINED;
    e.handle = handle;
    e.new_state = e.old_state = LifecycleState::UP;
    e.station = station;
    return e;
}

ApEvent ApEvent::client_left(const std::string& handle, const Station& station) {
    ApEvent e = client_joined(handle, station);
    e.type = ApEventType::CLIENT_LEFT;
    return e;
}

ApEvent ApEvent::state_changed(const std::string& handle, LifecycleState from,
                               LifecycleState to, const std::string& reason) {
    ApEvent e;
    e.type = ApEventType::STATE_CHANGED;
    e.handle = handle;
    e.old_state = from;
    e.new_state = to;
    e.reason = reason;
    return e;
}

ApEvent ApEvent::configuration_failed(const std::string& handle, const std::string& reason) {
    ApEvent e;
    e.type = ApEventType::CONFIGURATION_FAILED;
    e.handle = handle;
    e.old_state = LifecycleState::CONFIGURING;
    e.new_state = LifecycleState::ERROR;
    e.reason = reason;
    return e;
}

std::string ApEvent::describe() const {
    switch (type) {
    case ApEventType::CLIENT_JOINED:
    case ApEventType::CLIENT_LEFT:
        return fmt::format("{} {} {}", handle, ap_event_type_name(type),
                           station ? station->mac.to_string() : "?");
    case ApEventType::STATE_CHANGED:
        if (reason.empty()) {
            return fmt::format("{} {} {} -> {}", handle, ap_event_type_name(type),
                               lifecycle_state_name(old_state), lifecycle_state_name(new_state));
        }
        return fmt::format("{} {} {} -> {} ({})", handle, ap_event_type_name(type),
                           lifecycle_state_name(old_state), lifecycle_state_name(new_state),
                           reason);
    case ApEventType::CONFIGURATION_FAILED:
        return fmt::format("{} {}: {}", handle, ap_event_type_name(type), reason);
    }
    return handle;
}

} // namespace proton
