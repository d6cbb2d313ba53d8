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
 * @file connection.cpp
 * @brief BSD socket implementation of the framed `Connection`.
 */

#include "parley/network/connection.hpp"

#include "parley/infra/error.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace parley::network {

Connection::Connection(int fd, std::string peer) : fd_(fd), peer_(std::move(peer)), closed_(false)
{
}

Connection::~Connection()
{
    close();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<Connection> Connection::connect_to(const std::string& host, int port)
{
    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port));

    if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        throw TransportError("invalid IPv4 address '" + host + "'");
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw TransportError(std::string("socket() failed: ") + std::strerror(errno));
    }

    if (::connect(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        int err = errno;
        ::close(fd);
        throw TransportError("could not connect to " + host + ":" + std::to_string(port) + ": " +
                             std::strerror(err));
    }

    return std::make_unique<Connection>(fd, host + ":" + std::to_string(port));
}

/**
 * @brief Writes a whole frame, looping over partial `send()` results.
 *
 * `MSG_NOSIGNAL` turns a write to a dead peer into `EPIPE` instead of a process-wide
 * `SIGPIPE`, so one broken recipient cannot take the server down.
 */
void Connection::send_frame(const std::string& payload)
{
    std::string frame = protocol::encode(payload);

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (closed_) {
        throw TransportError("send to " + peer_ + " after close");
    }

    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError("send to " + peer_ + " failed: " + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

/**
 * @brief Reads from the socket until the decoder yields a frame.
 */
std::optional<std::string> Connection::read_frame()
{
    char buffer[4096];

    while (true) {
        if (auto payload = decoder_.next()) {
            return payload;
        }

        if (closed_) {
            return std::nullopt;
        }

        ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);

        if (n > 0) {
            decoder_.feed(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            // Orderly shutdown (FIN). Any partial frame is dropped with the decoder state.
            return std::nullopt;
        } else if (errno == EINTR) {
            continue;
        } else if (closed_) {
            return std::nullopt;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw TransportError("receive from " + peer_ + " timed out");
        } else {
            throw TransportError("receive from " + peer_ + " failed: " + std::strerror(errno));
        }
    }
}

void Connection::close()
{
    if (closed_.exchange(true)) {
        return;
    }
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

bool Connection::set_receive_timeout(std::chrono::seconds timeout)
{
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count());
    tv.tv_usec = 0;
    return setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

} // namespace parley::network
