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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for Parley.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used by
 * the server, the client and the collaborators. Output from concurrent session
 * workers is serialized so that lines never interleave. Besides the console, the
 * server mirrors every entry into a plain-text chat log file.
 */

#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace parley::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information for troubleshooting.
    INFO,  ///< Nominal operational events (startup, joins, messages).
    WARN,  ///< Non-blocking anomalies (framing errors, dropped peers).
    ERROR, ///< Recoverable runtime errors that do not halt the system.
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * **Sinks:**
 * - Console: `TRACE`..`INFO` to `std::cout`, `WARN`..`FATAL` to `std::cerr`, ANSI colored.
 * - File (optional): the same lines without color codes, appended to the opened file.
 *
 * Entries below the configured minimum level are discarded before formatting.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to every active sink.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @note Thread-safe and blocking. A static lock is held for the whole entry.
     *
     * @code
     * parley::infra::Logger::log(LogLevel::INFO, "Network: listening on 127.0.0.1:12345");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that is emitted. Defaults to `TRACE`.
     */
    static void set_level(LogLevel level);

    /**
     * @brief Opens (in append mode) a file that mirrors every console entry.
     *
     * @param path Filesystem path of the log file, e.g. `chat_log.txt`.
     * @return true If the file is open and will receive subsequent entries.
     */
    static bool open_file(const std::string& path);

    /// @brief Flushes and closes the file sink, if any.
    static void close_file();

  private:
    /// @brief Guards both sinks and the level threshold.
    static std::mutex mutex_;

    static LogLevel min_level_;

    static std::ofstream file_;
};

} // namespace parley::infra
