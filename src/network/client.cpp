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
 * @file client.cpp
 * @brief Implementation of the interactive chat client.
 */

#include "parley/network/client.hpp"

#include "parley/infra/error.hpp"
#include "parley/infra/logger.hpp"
#include "parley/infra/string.hpp"

#include <istream>
#include <ostream>
#include <thread>

namespace parley::network {

using infra::Logger;
using infra::LogLevel;

Client::Client(const std::string& host, int port) : connection_(Connection::connect_to(host, port))
{
    Logger::log(LogLevel::INFO, "Client: [CONNECTED] to " + host + ":" + std::to_string(port));
}

Client::~Client()
{
    connection_->close();
}

bool Client::chat(const std::string& username, std::istream& in, std::ostream& out)
{
    connection_->send_frame(username);

    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out << "Welcome to the chat, " << username << "! Type your messages below:" << std::endl;
    }

    std::thread receiver([this, &username, &out] { receive_loop(username, out); });

    bool quit = false;
    std::string line;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(out_mutex_);
            out << username << ": " << std::flush;
        }

        if (!std::getline(in, line) || infra::String::to_lower(infra::String::trim(line)) == "/quit") {
            quit = true;
            break;
        }

        // An empty frame means "disconnect" to the server; blank lines are not sent.
        if (line.empty()) {
            continue;
        }

        if (connection_->is_closed()) {
            break;
        }

        try {
            connection_->send_frame(line);
        } catch (const Error& e) {
            std::lock_guard<std::mutex> lock(out_mutex_);
            out << "[ERROR] Could not send message: " << e.what() << std::endl;
            break;
        }
    }

    if (quit) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out << "You have left the chat." << std::endl;
    }

    connection_->close();
    receiver.join();

    Logger::log(LogLevel::DEBUG, "Client: Chat session ended.");
    return quit;
}

void Client::receive_loop(const std::string& username, std::ostream& out)
{
    try {
        while (std::optional<std::string> message = connection_->read_frame()) {
            std::lock_guard<std::mutex> lock(out_mutex_);
            out << "\r" << *message << "\n" << username << ": " << std::flush;
        }

        if (!connection_->is_closed()) {
            std::lock_guard<std::mutex> lock(out_mutex_);
            out << "\r[DISCONNECTED] Server closed the connection." << std::endl;
            connection_->close();
        }
    } catch (const Error& e) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out << "\r[ERROR] Receiving message: " << e.what() << std::endl;
        connection_->close();
    }
}

} // namespace parley::network
