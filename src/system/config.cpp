// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace olympus {

namespace {

/// Recursively add keys from defaults that are missing in target
/// @return true if anything was added
bool merge_missing_defaults(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= merge_missing_defaults(target[it.key()], it.value());
        }
    }
    return modified;
}

} // namespace

Config::Config() : data(get_default_config()) {}

json Config::get_default_config() {
    return {{"api",
             {{"base_url", "http://localhost:8081/api/v1"},
              {"timeout_ms", 30000},
              {"refresh_path", "/auth/refresh"}}},
            {"realtime",
             {{"url", "ws://localhost:8081/ws"},
              {"heartbeat_interval_ms", 30000},
              {"reconnect_delay_ms", 5000},
              {"max_reconnect_attempts", 5},
              {"connect_timeout_ms", 10000},
              {"resubscribe_on_reconnect", false}}},
            {"log_level", "info"},
            {"log_target", "auto"},
            {"log_path", ""}};
}

void Config::load_from_json(const json& document) {
    data = document.is_object() ? document : json::object();
    merge_missing_defaults(data, get_default_config());
}

bool Config::init(const std::string& config_path) {
    path = config_path;
    bool config_modified = false;

    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                parse_error = "top-level value is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing_defaults(data, get_default_config())) {
            spdlog::debug("[Config] Added missing default keys");
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified) {
        return save();
    }
    return true;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

const std::string& Config::get_path() const {
    return path;
}

bool Config::save() {
    if (path.empty()) {
        spdlog::warn("[Config] save() without a config path");
        return false;
    }

    spdlog::trace("[Config] Saving config to {}", path);

    try {
        fs::path target(path);
        fs::path dir = target.parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir);
        }

        std::string tmp_path = path + ".tmp";
        {
            std::ofstream o(tmp_path);
            if (!o.is_open()) {
                spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
                return false;
            }

            o << std::setw(2) << data << std::endl;

            if (!o.good()) {
                spdlog::error("[Config] Error writing to config file: {}", tmp_path);
                return false;
            }
        }

        fs::rename(tmp_path, target);
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace olympus
