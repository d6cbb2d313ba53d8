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
 * @file session.hpp
 * @brief Server-side state of one live client connection.
 *
 * @details
 * A `Session` is created by the accept loop for every connection and lives exactly
 * as long as that connection. It is the only owner of its `Connection`: routers and
 * broadcasters write to a client exclusively through `Session::send()`.
 */

#pragma once

#include "parley/network/connection.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace parley::chat {

class Registry;

/**
 * @class Session
 * @brief Identity, connection handle and lifecycle state of one client.
 *
 * @details
 * **Lifecycle:**
 * @code
 *   CONNECTED --(first frame = username)--> IDENTIFIED
 *       |                                       |
 *       +-------(EOF / error / shutdown)--------+--> CLOSED (terminal)
 * @endcode
 *
 * The username is written once, by `Registry::bind_username()`, and may be read
 * concurrently by other session workers; it is therefore guarded by `state_mutex_`.
 */
class Session {
  public:
    enum class State { CONNECTED, IDENTIFIED, CLOSED };

    using Clock = std::chrono::system_clock;

    /**
     * @param id Opaque, process-unique session handle.
     * @param connection The accepted connection. Ownership is transferred.
     */
    Session(std::string id, std::unique_ptr<network::Connection> connection);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }

    /// @brief Bound username, or `std::nullopt` while still `CONNECTED`.
    std::optional<std::string> username() const;

    State state() const;

    /// @brief Time the connection was accepted.
    Clock::time_point joined_at() const { return joined_at_; }

    /// @brief Whole seconds elapsed since `joined_at()`.
    uint64_t connected_seconds() const;

    /// @brief Peer address of the underlying connection (`ip:port`).
    const std::string& peer() const { return connection_->peer(); }

    /**
     * @brief Delivers one frame to this client.
     *
     * @throws parley::TransportError If the session is closed or the write fails.
     */
    void send(const std::string& payload);

    /**
     * @brief Blocks for the next frame from this client.
     *
     * @return The payload, or `std::nullopt` once the stream has ended.
     * @throws parley::FramingError, parley::TransportError
     */
    std::optional<std::string> receive();

    /**
     * @brief Enters `CLOSED` and shuts the connection down.
     *
     * @return true If this call performed the transition, false if already closed.
     */
    bool close();

    /**
     * @brief Applies a per-read idle timeout to the connection (0 = none).
     * @return true If the timeout is in effect.
     */
    bool set_idle_timeout(std::chrono::seconds timeout);

  private:
    friend class Registry;

    /// @brief `CONNECTED -> IDENTIFIED`. Called by the registry under its lock.
    void bind(const std::string& username);

    const std::string id_;

    const std::unique_ptr<network::Connection> connection_;

    const Clock::time_point joined_at_;

    mutable std::mutex state_mutex_;

    std::optional<std::string> username_;

    State state_;
};

} // namespace parley::chat
