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
 * @file string.hpp
 * @brief Supplementary text processing primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used by the command parser, the session handshake and the
 * console front end.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace parley::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if `s` is only whitespace.
     *
     * @code
     * std::string name = parley::infra::String::trim("  alice\r\n"); // "alice"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Splits on a single-character separator, at most `max_parts` pieces.
     *
     * The last piece keeps the unsplit remainder, separators included. Consecutive
     * separators produce empty pieces, mirroring a plain left-to-right split.
     *
     * @param s The text to split.
     * @param sep The separator character.
     * @param max_parts Upper bound on the number of pieces (0 = unbounded).
     *
     * @code
     * split("/private bob hi there", ' ', 3); // {"/private", "bob", "hi there"}
     * @endcode
     */
    static std::vector<std::string> split(const std::string& s, char sep, size_t max_parts = 0);

    /// @brief ASCII lower-case copy.
    static std::string to_lower(const std::string& s);

    /**
     * @brief Formats a duration as `H:MM:SS`.
     *
     * Hours are unbounded; minutes and seconds are zero-padded to two digits.
     * 125 seconds renders as `0:02:05`, 90061 seconds as `25:01:01`.
     */
    static std::string format_duration(uint64_t total_seconds);
};

} // namespace parley::infra
