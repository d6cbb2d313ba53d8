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
 * @file message.cpp
 * @brief Payload classification for the chat protocol.
 */

#include "parley/protocol/message.hpp"

namespace parley::protocol {

namespace {

constexpr CommandName kCommands[] = {CommandName::HELP, CommandName::LIST, CommandName::PRIVATE,
                                     CommandName::STATS};

} // namespace

const char* keyword(CommandName name)
{
    switch (name) {
    case CommandName::HELP:
        return "/help";
    case CommandName::LIST:
        return "/list";
    case CommandName::PRIVATE:
        return "/private";
    case CommandName::STATS:
        return "/stats";
    }
    return "";
}

/**
 * @brief Keywords are tried in declaration order and match as prefixes, so `/helpme`
 * is `/help`. The arguments are whatever follows the first space.
 */
Message parse(const std::string& payload)
{
    if (payload.empty() || payload[0] != '/') {
        return PlainText{payload};
    }

    for (CommandName name : kCommands) {
        const std::string word = keyword(name);
        if (payload.compare(0, word.size(), word) != 0) {
            continue;
        }
        size_t space = payload.find(' ');
        std::string args = (space == std::string::npos) ? "" : payload.substr(space + 1);
        return Command{name, args};
    }
    return PlainText{payload};
}

std::string render(const SystemNotice& notice)
{
    return "[SERVER] " + notice.body;
}

} // namespace parley::protocol
