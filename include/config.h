// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __OLYMPUS_CONFIG_H__
#define __OLYMPUS_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace olympus {

/**
 * @brief Client configuration loaded from a JSON file
 *
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Load once at startup, before the client starts.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init("/path/to/olympus.json");
 *
 * // Get with default fallback
 * std::string url = cfg.get<std::string>("/api/base_url", "http://localhost:8081/api/v1");
 *
 * // Set and save
 * cfg.set<int>("/realtime/max_reconnect_attempts", 10);
 * cfg.save();
 * ```
 */
class Config {
  private:
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to parse
     * is moved aside to <path>.corrupt and replaced with defaults. Missing keys are
     * filled in from the defaults without overwriting existing values.
     *
     * @param config_path Path to JSON configuration file
     * @return true if the file was loaded or created, false if it could not be written
     */
    bool init(const std::string& config_path);

    /**
     * @brief Replace the in-memory document (no file involved)
     *
     * Missing keys are filled in from the defaults.
     */
    void load_from_json(const json& document);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or type mismatch
     */
    template <typename T> T get(const std::string& json_ptr) const {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if path doesn't exist or holds a value of the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data.at(ptr).template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has unexpected type, using default: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Get JSON sub-object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written atomically (temp file + rename).
     *
     * @return true on success
     */
    bool save();

    /**
     * @brief Get configuration file path
     */
    const std::string& get_path() const;

    /**
     * @brief Default configuration document
     */
    static json get_default_config();
};

} // namespace olympus

#endif // __OLYMPUS_CONFIG_H__
