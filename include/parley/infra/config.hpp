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
 * @file config.hpp
 * @brief JSON-backed process configuration shared by server and client.
 *
 * @details
 * The configuration file is a flat JSON object:
 *
 * @code
 * {
 *     "HOST": "127.0.0.1",
 *     "PORT": 12345,
 *     "IDLE_TIMEOUT_SECONDS": 0,
 *     "LOG_FILE": "chat_log.txt",
 *     "USERS_FILE": "users.json"
 * }
 * @endcode
 *
 * On first run the file does not exist; the defaults are written to disk so an
 * operator has something to edit.
 */

#pragma once

#include <string>

namespace parley::infra {

/**
 * @struct Config
 * @brief Resolved runtime settings.
 */
struct Config {
    /// @brief IPv4 address the server binds to and the client connects to.
    std::string host = "127.0.0.1";

    /// @brief TCP port.
    int port = 12345;

    /// @brief Server-side read timeout per session in seconds (0 = wait forever).
    int idle_timeout_seconds = 0;

    /// @brief Chat log mirrored by the server (empty = console only).
    std::string log_file = "chat_log.txt";

    /// @brief Credential store consulted by the client before connecting.
    std::string users_file = "users.json";

    /**
     * @brief Loads configuration from `path`, creating it with defaults when absent.
     *
     * Keys missing from an existing file take their default values.
     *
     * @throws parley::ConfigError If the file cannot be parsed, a value has the wrong
     * type, or the port is outside 1..65535.
     */
    static Config load(const std::string& path);

    /**
     * @brief Writes this configuration to `path` as pretty-printed JSON.
     * @return true If the file was written completely.
     */
    bool save(const std::string& path) const;
};

} // namespace parley::infra
