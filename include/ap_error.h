// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace proton {

/**
 * @brief Access point operation result
 *
 * INVALID_CONFIG and BUSY are configuration errors raised before or instead
 * of any daemon interaction. The remaining failures come from the lifecycle
 * itself or from the control bus.
 */
enum class ApErrorType {
    NONE = 0,        ///< Operation succeeded
    INVALID_CONFIG,  ///< Local validation failed, daemon never contacted
    BUSY,            ///< Another operation is in flight on the same handle
    INVALID_STATE,   ///< Operation not valid from the current lifecycle state
    REJECTED,        ///< Daemon refused the request (not retried)
    TIMEOUT,         ///< No confirming reply or signal within the bound
    BUS_UNAVAILABLE, ///< Transport failure after retry exhaustion
    DECODE_ERROR     ///< Message shape did not match the expected schema
};

/**
 * @brief Detailed error information for access point operations
 */
struct ApError {
    ApErrorType type = ApErrorType::NONE;
    std::string message;   ///< Technical details (reason reported by daemon, etc.)
    std::string handle;    ///< Access point handle the error refers to
    std::string operation; ///< "configure", "start", "stop", "refresh", "attach", "decode"

    ApError() = default;
    ApError(ApErrorType t, const std::string& msg, const std::string& h = "",
            const std::string& op = "")
        : type(t), message(msg), handle(h), operation(op) {}

    bool success() const {
        return type == ApErrorType::NONE;
    }
    operator bool() const {
        return success();
    }

    /// ConfigError kinds: nothing was sent to the daemon for this request
    bool is_config_error() const {
        return type == ApErrorType::INVALID_CONFIG || type == ApErrorType::BUSY;
    }

    /**
     * @brief True for "try again" errors, false for "fix your input" errors
     */
    bool is_retryable() const {
        return type == ApErrorType::BUSY || type == ApErrorType::TIMEOUT ||
               type == ApErrorType::BUS_UNAVAILABLE;
    }

    std::string get_type_string() const {
        switch (type) {
        case ApErrorType::NONE:
            return "NONE";
        case ApErrorType::INVALID_CONFIG:
            return "INVALID_CONFIG";
        case ApErrorType::BUSY:
            return "BUSY";
        case ApErrorType::INVALID_STATE:
            return "INVALID_STATE";
        case ApErrorType::REJECTED:
            return "REJECTED";
        case ApErrorType::TIMEOUT:
            return "TIMEOUT";
        case ApErrorType::BUS_UNAVAILABLE:
            return "BUS_UNAVAILABLE";
        case ApErrorType::DECODE_ERROR:
            return "DECODE_ERROR";
        }
        return "UNKNOWN";
    }

    /// "TYPE: message" for logs and CLI output
    std::string to_string() const {
        if (success()) {
            return "OK";
        }
        return message.empty() ? get_type_string() : get_type_string() + ": " + message;
    }

    static ApError ok() {
        return ApError();
    }

    static ApError invalid_config(const std::string& what) {
        return ApError(ApErrorType::INVALID_CONFIG, what, "", "configure");
    }

    static ApError busy(const std::string& handle, const std::string& operation) {
        return ApError(ApErrorType::BUSY, "another operation is in flight on " + handle, handle,
                       operation);
    }

    static ApError invalid_state(const std::string& handle, const std::string& operation,
                                 const std::string& what) {
        return ApError(ApErrorType::INVALID_STATE, what, handle, operation);
    }

    static ApError rejected(const std::string& handle, const std::string& operation,
                            const std::string& reason) {
        return ApError(ApErrorType::REJECTED, reason, handle, operation);
    }

    static ApError timeout(const std::string& handle, const std::string& operation,
                           const std::string& what) {
        return ApError(ApErrorType::TIMEOUT, what, handle, operation);
    }

    static ApError bus_unavailable(const std::string& handle, const std::string& operation,
                                   const std::string& what) {
        return ApError(ApErrorType::BUS_UNAVAILABLE, what, handle, operation);
    }

    static ApError decode_error(const std::string& what) {
        return ApError(ApErrorType::DECODE_ERROR, what, "", "decode");
    }
};

} // namespace proton
