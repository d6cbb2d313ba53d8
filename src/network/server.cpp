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
 * @file server.cpp
 * @brief Implementation of the multi-threaded TCP chat server.
 *
 * @details
 * This file implements the listener loop, the per-connection session worker and
 * shutdown. Every exception raised while serving a client is caught inside that
 * client's worker, so a failing peer can never stop the accept loop or disturb
 * another session.
 */

#include "parley/network/server.hpp"

#include "parley/infra/error.hpp"
#include "parley/infra/logger.hpp"
#include "parley/infra/string.hpp"
#include "parley/network/connection.hpp"
#include "parley/protocol/message.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace parley::network {

using infra::Logger;
using infra::LogLevel;

Server::Server(infra::Config config)
    : config_(std::move(config)), port_(config_.port), server_fd_(-1), running_(false),
      session_counter_(0), router_(registry_, stats_)
{
}

Server::~Server()
{
    stop();

    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        close(fd);
    }
}

/**
 * @brief Gracefully terminates the server.
 *
 * The listening socket is only shut down here; the accept loop observes the failure
 * and releases the descriptor itself. Closing the sessions makes every blocked worker
 * return from `receive()` and run its normal cleanup path.
 */
void Server::stop()
{
    bool was_running = running_.exchange(false);

    int fd = server_fd_.load();
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
    }

    for (const chat::SessionPtr& session : registry_.snapshot()) {
        session->close();
    }

    if (was_running) {
        Logger::log(LogLevel::INFO, "Network: Shutdown signal received. Stopping server...");
    }
}

void Server::listen()
{
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw TransportError(std::string("socket() failed: ") + std::strerror(errno));
    }

    // Allow immediate address reuse to facilitate quick restarts.
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        int err = errno;
        close(fd);
        throw TransportError(std::string("setsockopt() failed: ") + std::strerror(err));
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(config_.port));

    if (inet_pton(AF_INET, config_.host.c_str(), &address.sin_addr) != 1) {
        close(fd);
        throw TransportError("invalid bind address '" + config_.host + "'");
    }

    if (bind(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        int err = errno;
        close(fd);
        throw TransportError("failed to bind " + config_.host + ":" +
                             std::to_string(config_.port) + ": " + std::strerror(err));
    }

    if (::listen(fd, 128) < 0) {
        int err = errno;
        close(fd);
        throw TransportError(std::string("listen() failed: ") + std::strerror(err));
    }

    // Resolve the actual port when an ephemeral one (0) was requested.
    socklen_t len = sizeof(address);
    if (getsockname(fd, (struct sockaddr*)&address, &len) == 0) {
        port_ = ntohs(address.sin_port);
    }

    server_fd_ = fd;
    running_ = true;
    Logger::log(LogLevel::INFO,
                "Network: [SERVER STARTED] Listening on " + config_.host + ":" +
                    std::to_string(port_));
}

/**
 * @brief Main Server Event Loop.
 */
void Server::run()
{
    if (server_fd_ < 0) {
        listen();
    }

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        int sock = accept(server_fd_, (struct sockaddr*)&client_addr, &len);

        if (sock < 0) {
            if (!running_) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            Logger::log(LogLevel::ERROR,
                        std::string("Network: Accept failed: ") + std::strerror(errno));
            continue;
        }

        if (!running_) {
            close(sock);
            break;
        }

        char ip[INET_ADDRSTRLEN] = "unknown";
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string peer = std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port));

        Logger::log(LogLevel::INFO, "Network: [CONNECTION] Client connected from " + peer);

        auto session = std::make_shared<chat::Session>(
            next_session_id(), std::make_unique<Connection>(sock, peer));

        if (config_.idle_timeout_seconds > 0 &&
            !session->set_idle_timeout(std::chrono::seconds(config_.idle_timeout_seconds))) {
            Logger::log(LogLevel::WARN, "Network: Could not apply idle timeout to " + peer);
        }

        try {
            registry_.register_session(session);
        } catch (const DuplicateConnection& e) {
            Logger::log(LogLevel::ERROR, "Network: " + std::string(e.what()) + " (peer " + peer +
                                             "). Dropping connection.");
            session->close();
            continue;
        }

        // stop() may have taken its snapshot before this session was registered.
        if (!running_) {
            close_session(session);
            break;
        }

        scheduler_.enqueue([this, session]() { handle_client(session); });
        Logger::log(LogLevel::DEBUG,
                    "Network: [ACTIVE CONNECTIONS] " + std::to_string(registry_.size()));
    }

    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        close(fd);
    }
    Logger::log(LogLevel::INFO, "Network: Server event loop terminated.");
}

/**
 * @brief Session Worker Routine.
 *
 * **Protocol:**
 * 1. The first frame is the username (`CONNECTED -> IDENTIFIED`).
 * 2. Each subsequent non-empty frame is routed.
 * 3. End of stream, an empty frame or any error ends the session (`-> CLOSED`).
 */
void Server::handle_client(const chat::SessionPtr& session)
{
    const std::string& peer = session->peer();

    try {
        std::optional<std::string> first = session->receive();
        if (!first) {
            Logger::log(LogLevel::INFO,
                        "Network: " + peer + " disconnected before sending a username.");
            close_session(session);
            return;
        }

        std::string username = infra::String::trim(*first);
        if (username.empty()) {
            Logger::log(LogLevel::WARN, "Network: " + peer + " sent an empty username.");
            close_session(session);
            return;
        }

        try {
            registry_.bind_username(session->id(), username);
        } catch (const DuplicateUsername& e) {
            Logger::log(LogLevel::WARN, "Network: " + peer + " rejected: " + e.what());
            session->send(protocol::render(
                protocol::SystemNotice{"Username '" + username + "' is already in use.\n"}));
            close_session(session);
            return;
        }

        Logger::log(LogLevel::INFO,
                    "Network: [NEW CONNECTION] " + username + " (" + peer + ") connected.");
        router_.announce_join(*session);

        while (std::optional<std::string> frame = session->receive()) {
            if (frame->empty()) {
                break;
            }
            router_.route(*session, *frame);
        }
    } catch (const FramingError& e) {
        Logger::log(LogLevel::WARN, "Network: [ERROR] " + peer + ": " + e.what());
    } catch (const TransportError& e) {
        Logger::log(LogLevel::WARN, "Network: [DISCONNECTED] " + peer + " " + e.what());
    } catch (const InvariantViolation& e) {
        Logger::log(LogLevel::ERROR, "Network: [ERROR] session " + session->id() + " (" + peer +
                                         "): " + e.what());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, "Network: [ERROR] " + peer + ": " + e.what());
    }

    close_session(session);
}

/**
 * @brief Closes, deregisters and, for identified sessions, announces the departure.
 *
 * Safe to call more than once: only the call that actually removes the session from
 * the registry broadcasts the leave notice.
 */
void Server::close_session(const chat::SessionPtr& session)
{
    session->close();

    if (!registry_.remove(session->id())) {
        return;
    }

    if (std::optional<std::string> name = session->username()) {
        router_.announce_leave(*session);
        std::string duration = infra::String::format_duration(session->connected_seconds());
        Logger::log(LogLevel::INFO, "Network: [DISCONNECTED] " + *name + " (" + session->peer() +
                                        ") disconnected after " + duration + ".");
    }
}

std::string Server::next_session_id()
{
    return "conn-" + std::to_string(++session_counter_);
}

} // namespace parley::network
