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
 * @file connection.hpp
 * @brief RAII stream-socket endpoint speaking the framed chat protocol.
 *
 * @details
 * This header declares `Connection`, which owns one connected socket file
 * descriptor and layers the frame codec on top of it. It is used on both sides of
 * the wire: the server wraps every accepted socket in one, the client wraps its
 * outbound socket in one.
 */

#pragma once

#include "parley/protocol/codec.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace parley::network {

/**
 * @class Connection
 * @brief Owns a socket descriptor and exchanges whole frames over it.
 *
 * @details
 * **Threading Contract:**
 * - `send_frame()` may be called from any thread; writes are serialized so frames
 *   from concurrent senders never interleave on the wire.
 * - `read_frame()` is called by one reader thread only (the session worker or the
 *   client receive path).
 * - `close()` may be called from any thread and unblocks a reader blocked in `recv()`.
 *
 * The descriptor itself is released in the destructor, never earlier, so a racing
 * writer cannot hit a recycled descriptor number.
 */
class Connection {
  public:
    /**
     * @brief Adopts a connected socket.
     *
     * @param fd Connected stream socket. Ownership is transferred.
     * @param peer Human-readable peer address used in log lines.
     */
    Connection(int fd, std::string peer);

    /// @brief Closes the descriptor.
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Opens a TCP connection to `host:port`.
     *
     * @throws parley::TransportError If the address is invalid or the connect fails.
     */
    static std::unique_ptr<Connection> connect_to(const std::string& host, int port);

    /**
     * @brief Encodes and writes one frame.
     *
     * @throws parley::FramingError If the payload is oversized.
     * @throws parley::TransportError If the socket is closed or the peer reset it.
     */
    void send_frame(const std::string& payload);

    /**
     * @brief Blocks until one complete frame has arrived.
     *
     * @return The payload, or `std::nullopt` on orderly end of stream (peer FIN or a
     * local `close()`). Bytes of an unfinished frame are discarded.
     * @throws parley::FramingError If the peer sent an oversized frame.
     * @throws parley::TransportError On a socket error or receive timeout.
     */
    std::optional<std::string> read_frame();

    /**
     * @brief Shuts the socket down in both directions. Idempotent.
     *
     * Blocked readers observe end of stream; subsequent sends fail.
     */
    void close();

    /// @brief Whether `close()` has been called.
    bool is_closed() const { return closed_; }

    /**
     * @brief Bounds each blocking read; zero restores the default (wait forever).
     * @return true If the socket option was applied.
     */
    bool set_receive_timeout(std::chrono::seconds timeout);

    const std::string& peer() const { return peer_; }

  private:
    int fd_;

    std::string peer_;

    std::atomic<bool> closed_;

    /// @brief Serializes concurrent `send_frame()` calls.
    std::mutex write_mutex_;

    protocol::FrameDecoder decoder_;
};

} // namespace parley::network
