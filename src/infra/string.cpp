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
 * @file string.cpp
 * @brief Implementation of the text processing primitives.
 */

#include "parley/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace parley::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The `static_cast<unsigned char>` keeps `std::isspace` defined for UTF-8
 * continuation bytes, which are negative in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::vector<std::string> String::split(const std::string& s, char sep, size_t max_parts)
{
    std::vector<std::string> parts;
    size_t begin = 0;

    while (max_parts == 0 || parts.size() + 1 < max_parts) {
        size_t pos = s.find(sep, begin);
        if (pos == std::string::npos) {
            break;
        }
        parts.push_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }

    // Remainder (or the whole string when no separator was found).
    parts.push_back(s.substr(begin));
    return parts;
}

std::string String::to_lower(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string String::format_duration(uint64_t total_seconds)
{
    uint64_t hours = total_seconds / 3600;
    uint64_t minutes = (total_seconds % 3600) / 60;
    uint64_t seconds = total_seconds % 60;

    std::ostringstream ss;
    ss << hours << ':' << std::setfill('0') << std::setw(2) << minutes << ':' << std::setw(2)
       << seconds;
    return ss.str();
}

} // namespace parley::infra
