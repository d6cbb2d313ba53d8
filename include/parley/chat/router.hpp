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
 * @file router.hpp
 * @brief Command dispatcher and message fan-out for the chat server.
 *
 * @details
 * This header declares the `Router`, the application layer of the server. It sits
 * between the session workers (which decode frames) and the registry (which knows
 * who is connected), turning each payload into zero or more outbound frames.
 */

#pragma once

#include "parley/chat/registry.hpp"
#include "parley/protocol/message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace parley::chat {

/**
 * @struct ServerStats
 * @brief Process-lifetime counters reported by `/stats`.
 */
struct ServerStats {
    using Clock = std::chrono::steady_clock;

    /// @param start Server start instant. Tests pass an earlier instant to fake uptime.
    explicit ServerStats(Clock::time_point start = Clock::now()) : start_time(start) {}

    /// @brief Plain chat lines successfully routed. Commands are not counted.
    std::atomic<uint64_t> message_count{0};

    const Clock::time_point start_time;

    /// @brief Whole seconds elapsed since `start_time`.
    uint64_t uptime_seconds() const;
};

/**
 * @class Router
 * @brief Interprets client payloads and delivers the resulting frames.
 *
 * @details
 * **Dispatch Table:**
 * | Input                    | Effect                                                  |
 * |--------------------------|---------------------------------------------------------|
 * | `/help`                  | Command catalog, to the sender only.                    |
 * | `/list`                  | Identified usernames in join order, to the sender only. |
 * | `/private <user> <text>` | Text to `<user>`, confirmation to the sender.           |
 * | `/stats`                 | Session count, message count and uptime, to the sender. |
 * | anything else            | `<username>: <text>` to every other identified session. |
 *
 * Usage errors (bad `/private` arity, unknown user) are answered with a one-line
 * `[SERVER]` reply and never close the connection.
 *
 * **Failure Isolation:** a failed write to a recipient is logged and skipped; it never
 * aborts delivery to the others. A failed write back to the *sender* propagates to the
 * sender's worker, which closes that session.
 */
class Router {
  public:
    Router(Registry& registry, ServerStats& stats);

    /**
     * @brief Handles one decoded payload from an identified session.
     *
     * @throws parley::TransportError If replying to the sender fails.
     * @throws parley::InvariantViolation If the sender has no username yet.
     */
    void route(Session& sender, const std::string& payload);

    /// @brief Broadcasts `[SERVER] <user> has joined the chat.` to everyone else.
    void announce_join(const Session& session);

    /// @brief Broadcasts `[SERVER] <user> has left the chat.` to everyone else.
    void announce_leave(const Session& session);

    /**
     * @brief Sends `payload` to every identified session except `sender_id`.
     *
     * @return Number of recipients the frame was written to.
     */
    size_t broadcast(const std::string& payload, const std::string& sender_id);

    /// @brief The `/help` reply.
    static std::string help_text();

  private:
    void dispatch(Session& sender, const std::string& username, const protocol::Command& command);

    void send_user_list(Session& sender, const std::string& username);

    void send_private(Session& sender, const std::string& username, const std::string& args);

    void send_stats(Session& sender, const std::string& username);

    Registry& registry_;

    ServerStats& stats_;
};

} // namespace parley::chat
