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
 * @file client.hpp
 * @brief Interactive chat client with independent send and receive paths.
 */

#pragma once

#include "parley/network/connection.hpp"

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace parley::network {

/**
 * @class Client
 * @brief One persistent server connection driven by a line-oriented console.
 *
 * @details
 * **Threading Model:**
 * - **Send path** (calling thread): blocks on the input stream and forwards every
 *   non-empty line as a frame. `/quit` (any case) or end of input ends the chat locally
 *   without a server round trip.
 * - **Receive path** (dedicated thread): blocks on the socket and renders every frame
 *   as soon as it arrives, independently of user input.
 *
 * Closing the connection from the send path unblocks the receive path, which is then
 * joined before `chat()` returns.
 */
class Client {
  public:
    /**
     * @brief Connects to the server.
     *
     * @throws parley::TransportError If the connection cannot be established.
     */
    Client(const std::string& host, int port);

    /// @brief Closes the connection.
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * @brief Sends the username handshake and runs the chat until quit or disconnect.
     *
     * @param username The (already authenticated) identity announced to the server.
     * @param in Source of user lines, typically `std::cin`.
     * @param out Sink for rendered messages and prompts, typically `std::cout`.
     * @return true If the user quit locally, false if the server connection was lost.
     */
    bool chat(const std::string& username, std::istream& in, std::ostream& out);

  private:
    /// @brief Receive path body. Runs until end of stream or a decode/transport error.
    void receive_loop(const std::string& username, std::ostream& out);

    std::unique_ptr<Connection> connection_;

    /// @brief Serializes writes to the shared output stream from both paths.
    std::mutex out_mutex_;
};

} // namespace parley::network
