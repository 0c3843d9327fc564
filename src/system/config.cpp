// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "error_reporting.h"

#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace proton {

bool Config::load(const std::string& config_path) {
    path = config_path;
    data = json::object();

    struct stat buffer;
    if (stat(config_path.c_str(), &buffer) != 0) {
        spdlog::info("[Config] No config at {}, using defaults", config_path);
        return false;
    }

    spdlog::info("[Config] Loading config from {}", config_path);
    try {
        std::ifstream in(config_path);
        json parsed = json::parse(in);
        if (!parsed.is_object()) {
            spdlog::error("[Config] {} does not contain a JSON object", config_path);
            return false;
        }
        data = std::move(parsed);
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        return false;
    }

    spdlog::debug("[Config] Loaded {} top-level sections", data.size());
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            spdlog::error("[Config] Configuration text is not a JSON object");
            return false;
        }
        data = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse configuration text: {}", e.what());
        return false;
    }
}

bool Config::contains(const std::string& json_ptr) const {
    return data.contains(json::json_pointer(json_ptr));
}

json Config::get_json(const std::string& json_ptr) const {
    json::json_pointer ptr(json_ptr);
    if (!data.contains(ptr)) {
        return json();
    }
    return data.at(ptr);
}

bool Config::save() {
    if (path.empty()) {
        LOG_ERROR_INTERNAL("[Config] save() called without a loaded path");
        return false;
    }

    spdlog::trace("[Config] Saving config to {}", path);

    std::ofstream o(path);
    if (!o.is_open()) {
        LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", path);
        return false;
    }

    o << std::setw(2) << data << std::endl;

    if (!o.good()) {
        LOG_ERROR_INTERNAL("Error writing to config file: {}", path);
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

} // namespace proton
