// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ap_types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace proton {

enum class ApEventType {
    CLIENT_JOINED,
    CLIENT_LEFT,
    STATE_CHANGED,
    CONFIGURATION_FAILED,
};

const char* ap_event_type_name(ApEventType type);

/**
 * @brief Observable access point event
 *
 * - CLIENT_JOINED / CLIENT_LEFT: @c station is set
 * - STATE_CHANGED: @c old_state / @c new_state, @c reason when new_state is ERROR
 * - CONFIGURATION_FAILED: @c reason
 */
struct ApEvent {
    ApEventType type = ApEventType::STATE_CHANGED;
    std::string handle;
    LifecycleState old_state = LifecycleState::DOWN;
    LifecycleState new_state = LifecycleState::DOWN;
    std::string reason;
    std::optional<Station> station;

    static ApEvent client_joined(const std::string& handle, const Station& station);
    static ApEvent client_left(const std::string& handle, const Station& station);
    static ApEvent state_changed(const std::string& handle, LifecycleState from,
                                 LifecycleState to, const std::string& reason = "");
    static ApEvent configuration_failed(const std::string& handle, const std::string& reason);

    /// One-line description for logs and the monitor command
    std::string describe() const;
};

using ApEventCallback = std::function<void(const ApEvent&)>;

/**
 * @brief Observer handle returned by subscribe()
 *
 * Valid IDs are always > 0.
 */
using ObserverId = uint64_t;
constexpr ObserverId INVALID_OBSERVER_ID = 0;

} // namespace proton
