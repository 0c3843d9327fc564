// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

/**
 * @file error_reporting.h
 * @brief Logging macros for internal faults
 *
 * Internal faults are conditions the caller cannot act on (malformed daemon
 * messages, callback exceptions, socket setup failures). They are logged with
 * an "[INTERNAL]" marker so they stand out from lifecycle errors, which are
 * returned to the caller as ApError values.
 *
 * Usage:
 * ```cpp
 * LOG_ERROR_INTERNAL("Failed to attach monitor to {}", path);
 * LOG_WARN_INTERNAL("Dropping malformed signal '{}': {}", name, err.message);
 * ```
 */

#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)
