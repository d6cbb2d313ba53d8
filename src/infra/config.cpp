/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file config.cpp
 * @brief cJSON-based loader for the process configuration file.
 */

#include "parley/infra/config.hpp"

#include "parley/infra/error.hpp"
#include "parley/infra/logger.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace parley::infra {

namespace {

/// @brief Reads an optional string member; absent keys keep `out` untouched.
void read_string(const cJSON* root, const char* key, std::string& out)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return;
    }
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    out = item->valuestring;
}

/// @brief Reads an optional integer member; absent keys keep `out` untouched.
void read_int(const cJSON* root, const char* key, int& out)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return;
    }
    if (!cJSON_IsNumber(item)) {
        throw ConfigError(std::string("'") + key + "' must be a number");
    }
    out = item->valueint;
}

} // namespace

/**
 * @brief Loads and validates the configuration file.
 *
 * **Resolution Order:**
 * 1. Start from the compiled-in defaults.
 * 2. If the file is missing, persist the defaults and return them.
 * 3. Otherwise overlay every key present in the file.
 */
Config Config::load(const std::string& path)
{
    Config config;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::log(LogLevel::WARN,
                    "Config: '" + path + "' not found. Writing default configuration.");
        if (!config.save(path)) {
            Logger::log(LogLevel::WARN, "Config: Could not write defaults to '" + path + "'.");
        }
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string raw = buffer.str();

    cJSON* root = cJSON_Parse(raw.c_str());
    if (!root) {
        throw ConfigError("'" + path + "' is not valid JSON");
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw ConfigError("'" + path + "' must contain a JSON object");
    }

    try {
        read_string(root, "HOST", config.host);
        read_int(root, "PORT", config.port);
        read_int(root, "IDLE_TIMEOUT_SECONDS", config.idle_timeout_seconds);
        read_string(root, "LOG_FILE", config.log_file);
        read_string(root, "USERS_FILE", config.users_file);
    } catch (...) {
        cJSON_Delete(root);
        throw;
    }
    cJSON_Delete(root);

    if (config.port < 1 || config.port > 65535) {
        throw ConfigError("PORT " + std::to_string(config.port) + " is out of range");
    }
    if (config.idle_timeout_seconds < 0) {
        throw ConfigError("IDLE_TIMEOUT_SECONDS must not be negative");
    }

    return config;
}

bool Config::save(const std::string& path) const
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "HOST", host.c_str());
    cJSON_AddNumberToObject(root, "PORT", port);
    cJSON_AddNumberToObject(root, "IDLE_TIMEOUT_SECONDS", idle_timeout_seconds);
    cJSON_AddStringToObject(root, "LOG_FILE", log_file.c_str());
    cJSON_AddStringToObject(root, "USERS_FILE", users_file.c_str());

    char* raw = cJSON_Print(root);
    cJSON_Delete(root);
    if (!raw) {
        return false;
    }

    std::ofstream file(path, std::ios::trunc);
    if (file.is_open()) {
        file << raw << '\n';
    }
    free(raw);

    return file.good();
}

} // namespace parley::infra
