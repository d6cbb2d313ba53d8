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
 * @file message.hpp
 * @brief Application-level message model of the chat protocol.
 *
 * @details
 * A decoded frame is classified into one of three immutable shapes:
 * - `Command`: a slash keyword recognized by the server (`/help`, `/list`,
 *   `/private`, `/stats`) and the raw argument text following it.
 * - `PlainText`: anything else, including unknown `/xxx` words.
 * - `SystemNotice`: text generated by the server itself (join/leave/errors).
 */

#pragma once

#include <string>
#include <variant>

namespace parley::protocol {

/**
 * @enum CommandName
 * @brief The closed set of server commands.
 */
enum class CommandName { HELP, LIST, PRIVATE, STATS };

/**
 * @struct Command
 * @brief A recognized slash command.
 */
struct Command {
    const CommandName name;

    /// @brief Everything after the first space of the payload ("" if there is none).
    const std::string args;
};

/// @brief An ordinary chat line, broadcast verbatim.
struct PlainText {
    const std::string body;
};

/// @brief A server-generated notice such as a join or leave announcement.
struct SystemNotice {
    const std::string body;
};

using Message = std::variant<Command, PlainText, SystemNotice>;

/**
 * @brief Classifies a client payload as a `Command` or `PlainText`.
 *
 * A payload is a command when it starts with a keyword, tried in the order
 * `/help`, `/list`, `/private`, `/stats`: `/list`, `/list now` and `/lister` are all
 * `/list`. `/quit`, `/HELP` and ` /list` are plain text.
 */
Message parse(const std::string& payload);

/// @brief Keyword for a command, including the leading slash.
const char* keyword(CommandName name);

/**
 * @brief Renders a notice as it appears on the wire: `[SERVER] <body>`.
 */
std::string render(const SystemNotice& notice);

} // namespace parley::protocol
