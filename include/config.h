// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace proton {

using json = nlohmann::json;

/**
 * @brief JSON configuration file reader
 *
 * Loads a JSON document and exposes values through JSON pointer syntax
 * (RFC 6901). The controller core never reads files itself; front ends such
 * as proton-apctl load a Config and derive ControllerSettings and
 * AccessPointConfig values from it.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.load("/etc/proton/proton.json");
 *
 * int timeout = cfg.get<int>("/controller/operation_timeout_ms", 5000);
 * std::string dir = cfg.get<std::string>("/hostapd/control_dir", "/var/run/hostapd");
 * ```
 */
class Config {
  protected:
    std::string path;
    json data = json::object();

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config() = default;

    /**
     * @brief Load configuration from file
     *
     * A missing file leaves the configuration empty (all getters return their
     * defaults). A file that fails to parse is reported and also leaves it empty.
     *
     * @param config_path Path to JSON configuration file
     * @return true if the file existed and parsed
     */
    bool load(const std::string& config_path);

    /**
     * @brief Load configuration from a JSON string
     *
     * @return true if the text parsed as a JSON object
     */
    bool load_string(const std::string& text);

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of the
     * wrong type.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/controller/retry_attempts")
     * @param default_value Fallback value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data.at(ptr).template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Wrong type at {}: {} (using default)", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate objects. In-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    bool contains(const std::string& json_ptr) const;

    /**
     * @brief Get JSON sub-tree at path (null if absent)
     */
    json get_json(const std::string& json_ptr) const;

    /**
     * @brief Write the configuration back to the loaded path
     *
     * @return true on success
     */
    bool save();

    const std::string& get_path() const {
        return path;
    }
};

} // namespace proton
