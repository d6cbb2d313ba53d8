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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats each entry once (timestamp + severity tag + payload) and writes it to the
 * console with ANSI colors and, when a file sink is open, to the log file without them.
 */

#include "parley/infra/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace parley::infra {

std::mutex Logger::mutex_;
LogLevel Logger::min_level_ = LogLevel::TRACE;
std::ofstream Logger::file_;

namespace {

/// @brief Severity tag and ANSI color prefix for a level.
struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle style_of(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return {"[TRCE] ", "\033[90m"};
    case LogLevel::DEBUG:
        return {"[DBUG] ", "\033[36m"};
    case LogLevel::INFO:
        return {"[INFO] ", "\033[32m"};
    case LogLevel::WARN:
        return {"[WARN] ", "\033[33m"};
    case LogLevel::ERROR:
        return {"[FAIL] ", "\033[31m"};
    case LogLevel::FATAL:
        return {"[CRIT] ", "\033[1;31m"};
    }
    return {"[????] ", ""};
}

} // namespace

/**
 * @brief Dispatches a formatted log entry to the console and the optional file sink.
 *
 * Operational Logic:
 * 1. **Filtering**: Entries below `min_level_` return before any formatting.
 * 2. **Chronometry**: Captures the wall clock as `[YYYY-MM-DD HH:MM:SS]`.
 * 3. **Stream Segregation**: `WARN` and above go to `stderr`.
 * 4. **Mirroring**: The uncolored line is appended to the file sink.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // Mutex protects std::localtime's internal static buffer.
    std::ostringstream stamp;
    stamp << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    LevelStyle style = style_of(level);
    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    stream << stamp.str() << style.color << style.tag << message << "\033[0m" << std::endl;

    if (file_.is_open()) {
        file_ << stamp.str() << style.tag << message << '\n';
        file_.flush();
    }
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::open_file(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::close_file()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace parley::infra
