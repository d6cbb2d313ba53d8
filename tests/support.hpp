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
 * @file support.hpp
 * @brief Fixtures shared by the chat and network suites.
 */

#pragma once

#include "parley/chat/registry.hpp"
#include "parley/chat/session.hpp"
#include "parley/network/connection.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>

namespace parley::test {

/**
 * @brief A server-side session wired to an in-process peer through `socketpair()`.
 *
 * `remote` plays the client: whatever the session sends can be read from it.
 */
struct Peer {
    chat::SessionPtr session;
    std::unique_ptr<network::Connection> remote;
    int remote_fd = -1;

    /// @brief True if at least one byte is waiting on the client end.
    bool has_pending() const
    {
        char byte;
        return ::recv(remote_fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT) > 0;
    }

    /// @brief Reads one frame, failing after `timeout` instead of hanging the suite.
    std::string read(std::chrono::seconds timeout = std::chrono::seconds(5))
    {
        if (!remote->set_receive_timeout(timeout)) {
            throw std::runtime_error("could not set receive timeout");
        }
        std::optional<std::string> frame = remote->read_frame();
        if (!frame) {
            throw std::runtime_error("peer closed before a frame arrived");
        }
        return *frame;
    }
};

/**
 * @brief Builds a session named `id` over a fresh socket pair.
 */
inline Peer make_peer(const std::string& id)
{
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw std::runtime_error("socketpair() failed");
    }

    Peer peer;
    peer.session =
        std::make_shared<chat::Session>(id, std::make_unique<network::Connection>(fds[0], id));
    peer.remote = std::make_unique<network::Connection>(fds[1], id + "-remote");
    peer.remote_fd = fds[1];
    return peer;
}

/**
 * @brief Builds a peer and registers it under `username`.
 */
inline Peer join(chat::Registry& registry, const std::string& id, const std::string& username)
{
    Peer peer = make_peer(id);
    registry.register_session(peer.session);
    registry.bind_username(id, username);
    return peer;
}

/**
 * @brief Polls `condition` until it holds or `timeout` expires.
 */
inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace parley::test
