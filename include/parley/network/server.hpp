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
 * @file server.hpp
 * @brief Multi-threaded TCP chat listener and session dispatcher.
 *
 * @details
 * This header declares the `Server` class, the network entry point of the chat
 * service. It handles the low-level BSD socket operations (bind, listen, accept),
 * owns the session `Registry`, and hands each accepted connection to a worker of
 * the `infra::Scheduler`.
 */

#pragma once

#include "parley/chat/registry.hpp"
#include "parley/chat/router.hpp"
#include "parley/infra/config.hpp"
#include "parley/infra/scheduler.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace parley::network {

/**
 * @class Server
 * @brief Thread-per-client chat server.
 *
 * @details
 * **Operational Workflow:**
 * 1. **Accept:** The calling thread blocks on `accept()`.
 * 2. **Register:** The socket is wrapped in a `Session` and added to the `Registry`.
 * 3. **Dispatch:** The session is submitted to the `Scheduler`; a worker runs
 *    `handle_client` for the whole lifetime of the connection.
 * 4. **Handshake:** The first frame binds the username and announces the join.
 * 5. **Route:** Each further frame goes through the `Router`.
 * 6. **Cleanup:** On EOF or error the session is closed, removed and its leave announced.
 */
class Server {
  public:
    /**
     * @brief Constructs the server. No socket is opened yet.
     *
     * @param config Bind address, port and per-session idle timeout.
     */
    explicit Server(infra::Config config);

    /**
     * @brief Destructor. Implicitly calls `stop()`; the scheduler then joins its workers.
     */
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Creates, binds and listens on the server socket.
     *
     * Port 0 binds an ephemeral port; `port()` reports the one chosen.
     *
     * @throws parley::TransportError If any socket call fails.
     */
    void listen();

    /**
     * @brief Runs the accept loop, calling `listen()` first if needed.
     *
     * @note **Blocking**. Returns after `stop()` or on a fatal accept error.
     */
    void run();

    /**
     * @brief Signals the server to shut down.
     *
     * **Shutdown Sequence:**
     * 1. Clears the `running_` flag.
     * 2. Shuts down the listening socket, unblocking `accept()`.
     * 3. Closes every registered session, unblocking its worker.
     */
    void stop();

    /// @brief The bound port (valid after `listen()`).
    int port() const { return port_; }

    /// @brief Whether the accept loop is (about to be) running.
    bool is_running() const { return running_; }

    chat::Registry& registry() { return registry_; }

    const chat::ServerStats& stats() const { return stats_; }

  private:
    /**
     * @brief The session loop (Worker Thread Context).
     *
     * Performs the username handshake, then feeds every frame to the router until the
     * client disconnects or an error occurs. All exceptions are contained here.
     *
     * @param session The session owned by this worker.
     */
    void handle_client(const chat::SessionPtr& session);

    /// @brief Performs the `* -> CLOSED` transition and the registry cleanup.
    void close_session(const chat::SessionPtr& session);

    /// @brief Produces the next opaque session id.
    std::string next_session_id();

    infra::Config config_;

    int port_;

    /// @brief Listening descriptor; swapped to -1 by whichever of `stop()` or the
    /// destructor closes it first.
    std::atomic<int> server_fd_;

    std::atomic<bool> running_;

    std::atomic<uint64_t> session_counter_;

    chat::Registry registry_;

    chat::ServerStats stats_;

    chat::Router router_;

    /// @brief Declared last so it is destroyed (and joins its workers) first.
    infra::Scheduler scheduler_;
};

} // namespace parley::network
