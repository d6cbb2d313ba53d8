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
 * @file router.cpp
 * @brief Implementation of the command dispatcher and broadcaster.
 *
 * @details
 * Every routing decision follows the same pipeline:
 * 1. **Classify**: `protocol::parse` turns the payload into a `Command` or `PlainText`.
 * 2. **Address**: a registry snapshot or username lookup resolves the recipients.
 * 3. **Deliver**: frames are written outside any registry lock.
 * 4. **Account**: plain chat lines bump `ServerStats::message_count`.
 */

#include "parley/chat/router.hpp"

#include "parley/infra/error.hpp"
#include "parley/infra/logger.hpp"
#include "parley/infra/string.hpp"

#include <sstream>
#include <type_traits>
#include <variant>

namespace parley::chat {

using infra::Logger;
using infra::LogLevel;

uint64_t ServerStats::uptime_seconds() const
{
    auto elapsed = Clock::now() - start_time;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

Router::Router(Registry& registry, ServerStats& stats) : registry_(registry), stats_(stats) {}

std::string Router::help_text()
{
    return protocol::render(protocol::SystemNotice{"Commands:\n"
                                                   "/help - Show this help message\n"
                                                   "/list - List all connected users\n"
                                                   "/private <username> <message> - Send a "
                                                   "private message\n"
                                                   "/stats - Show server statistics\n"});
}

void Router::route(Session& sender, const std::string& payload)
{
    std::optional<std::string> username = sender.username();
    if (!username) {
        throw InvariantViolation("session " + sender.id() + " routed a message before identifying");
    }

    protocol::Message message = protocol::parse(payload);

    std::visit(
        [&](const auto& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, protocol::Command>) {
                dispatch(sender, *username, msg);
            } else if constexpr (std::is_same_v<T, protocol::PlainText>) {
                Logger::log(LogLevel::INFO, "Chat: [MESSAGE] " + *username + ": " + msg.body);
                broadcast(*username + ": " + msg.body, sender.id());
                stats_.message_count++;
            } else {
                // Clients cannot originate notices; parse() never yields one.
                Logger::log(LogLevel::WARN, "Chat: Dropping notice-shaped payload from " +
                                                *username);
            }
        },
        message);
}

void Router::dispatch(Session& sender, const std::string& username, const protocol::Command& command)
{
    switch (command.name) {
    case protocol::CommandName::HELP:
        sender.send(help_text());
        Logger::log(LogLevel::INFO, "Chat: [HELP] Command issued by " + username);
        break;
    case protocol::CommandName::LIST:
        send_user_list(sender, username);
        break;
    case protocol::CommandName::PRIVATE:
        send_private(sender, username, command.args);
        break;
    case protocol::CommandName::STATS:
        send_stats(sender, username);
        break;
    }
}

void Router::send_user_list(Session& sender, const std::string& username)
{
    std::string reply = protocol::render(protocol::SystemNotice{"Connected users:\n"});
    for (const SessionPtr& session : registry_.snapshot()) {
        if (auto name = session->username()) {
            reply += *name + "\n";
        }
    }
    sender.send(reply);
    Logger::log(LogLevel::INFO, "Chat: [LIST] Command issued by " + username);
}

/**
 * @brief Handles `/private <user> <text>`.
 *
 * The argument string is split on its first space only, so the message text keeps
 * its own spaces. Both the target and the text must be present.
 */
void Router::send_private(Session& sender, const std::string& username, const std::string& args)
{
    std::vector<std::string> parts = infra::String::split(args, ' ', 2);
    if (parts.size() < 2) {
        sender.send(protocol::render(
            protocol::SystemNotice{"Invalid format. Use /private <username> <message>\n"}));
        return;
    }

    const std::string& target_name = parts[0];
    const std::string& text = parts[1];

    SessionPtr target = registry_.find_by_username(target_name);
    if (!target) {
        sender.send(protocol::render(protocol::SystemNotice{"User not found.\n"}));
        return;
    }

    try {
        target->send("[PRIVATE] " + username + ": " + text + "\n");
    } catch (const Error& e) {
        Logger::log(LogLevel::WARN, "Chat: Private delivery to " + target_name + " failed: " +
                                        e.what());
        sender.send(protocol::render(
            protocol::SystemNotice{"Could not deliver message to " + target_name + ".\n"}));
        return;
    }

    sender.send("[PRIVATE] To " + target_name + ": " + text + "\n");
    Logger::log(LogLevel::INFO, "Chat: [PRIVATE] " + username + " to " + target_name + ": " + text);
}

void Router::send_stats(Session& sender, const std::string& username)
{
    // Sessions still in the username handshake are not chat users yet.
    size_t active = 0;
    for (const SessionPtr& session : registry_.snapshot()) {
        if (session->username()) {
            active++;
        }
    }

    std::ostringstream ss;
    ss << "[SERVER STATS]\n"
       << "Active users: " << active << "\n"
       << "Total messages: " << stats_.message_count.load() << "\n"
       << "Uptime: " << infra::String::format_duration(stats_.uptime_seconds()) << "\n";

    sender.send(ss.str());
    Logger::log(LogLevel::INFO, "Chat: [STATS] Command issued by " + username);
}

void Router::announce_join(const Session& session)
{
    std::optional<std::string> name = session.username();
    if (!name) {
        return;
    }
    broadcast(protocol::render(protocol::SystemNotice{*name + " has joined the chat."}),
              session.id());
}

void Router::announce_leave(const Session& session)
{
    std::optional<std::string> name = session.username();
    if (!name) {
        return;
    }
    broadcast(protocol::render(protocol::SystemNotice{*name + " has left the chat."}),
              session.id());
}

/**
 * @brief Fans a frame out to a snapshot of the registry.
 *
 * Sessions that have not finished the username handshake are not part of the chat
 * yet and are skipped, as are sessions already closing.
 */
size_t Router::broadcast(const std::string& payload, const std::string& sender_id)
{
    size_t delivered = 0;

    for (const SessionPtr& session : registry_.snapshot()) {
        if (session->id() == sender_id || session->state() != Session::State::IDENTIFIED) {
            continue;
        }
        try {
            session->send(payload);
            delivered++;
        } catch (const Error& e) {
            Logger::log(LogLevel::WARN, "Chat: Broadcast to " + session->peer() + " failed: " +
                                            e.what());
        }
    }
    return delivered;
}

} // namespace parley::chat
