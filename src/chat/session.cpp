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
 * @file session.cpp
 * @brief Implementation of the per-connection session state.
 */

#include "parley/chat/session.hpp"

#include "parley/infra/error.hpp"

namespace parley::chat {

Session::Session(std::string id, std::unique_ptr<network::Connection> connection)
    : id_(std::move(id)), connection_(std::move(connection)), joined_at_(Clock::now()),
      state_(State::CONNECTED)
{
}

std::optional<std::string> Session::username() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return username_;
}

Session::State Session::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

uint64_t Session::connected_seconds() const
{
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - joined_at_);
    return elapsed.count() > 0 ? static_cast<uint64_t>(elapsed.count()) : 0;
}

void Session::send(const std::string& payload)
{
    if (state() == State::CLOSED) {
        throw TransportError("session " + id_ + " is closed");
    }
    connection_->send_frame(payload);
}

std::optional<std::string> Session::receive()
{
    if (state() == State::CLOSED) {
        return std::nullopt;
    }
    return connection_->read_frame();
}

bool Session::close()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == State::CLOSED) {
            return false;
        }
        state_ = State::CLOSED;
    }
    connection_->close();
    return true;
}

bool Session::set_idle_timeout(std::chrono::seconds timeout)
{
    return connection_->set_receive_timeout(timeout);
}

void Session::bind(const std::string& username)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != State::CONNECTED) {
        throw InvariantViolation("session " + id_ + " cannot bind a username in its current state");
    }
    username_ = username;
    state_ = State::IDENTIFIED;
}

} // namespace parley::chat
