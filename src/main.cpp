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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Argument Parsing and configuration loading.
 * 2. Mode selection (server or client).
 * 3. Server: signal handling, log file, accept loop.
 * 4. Client: register/login against the credential store, then the chat loop.
 */

#include "parley/auth/credential_store.hpp"
#include "parley/infra/config.hpp"
#include "parley/infra/error.hpp"
#include "parley/infra/logger.hpp"
#include "parley/infra/string.hpp"
#include "parley/network/client.hpp"
#include "parley/network/server.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <time.h>

using parley::infra::Logger;
using parley::infra::LogLevel;

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [CONFIG_PATH]\n"
              << "Options:\n"
              << "  CONFIG_PATH   JSON configuration file (Default: ./config.json)\n"
              << "  --help        Show this help message\n";
}

/// @brief Prints `prompt` and reads one trimmed line; false on end of input.
bool prompt_line(const std::string& prompt, std::string& out)
{
    std::cout << prompt << std::flush;
    if (!std::getline(std::cin, out)) {
        return false;
    }
    out = parley::infra::String::trim(out);
    return true;
}

/**
 * @brief Server mode.
 *
 * SIGINT/SIGTERM are blocked in every thread and consumed by a dedicated watcher
 * thread via `sigtimedwait()`, which then calls `Server::stop()` from ordinary thread
 * context.
 */
int run_server(const parley::infra::Config& config)
{
    if (!config.log_file.empty() && !Logger::open_file(config.log_file)) {
        Logger::log(LogLevel::WARN, "System: Could not open log file '" + config.log_file + "'.");
    }

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        Logger::log(LogLevel::FATAL, "System: Could not install signal mask.");
        return 1;
    }

    parley::network::Server server(config);
    std::atomic<bool> finished(false);

    std::thread watcher([&server, &signals, &finished] {
        // Poll so the watcher also exits when the loop ends without a signal.
        struct timespec interval = {0, 200 * 1000 * 1000};
        while (!finished) {
            int signum = sigtimedwait(&signals, nullptr, &interval);
            if (signum > 0) {
                Logger::log(LogLevel::WARN, "System: Interrupt received (Signal " +
                                                std::to_string(signum) +
                                                "). Initiating graceful shutdown...");
                server.stop();
                return;
            }
        }
    });

    int status = 0;
    try {
        server.run();
    } catch (const parley::Error& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        status = 1;
    }

    finished = true;
    watcher.join();

    Logger::log(LogLevel::INFO, "System: Shutdown complete. Goodnight.");
    Logger::close_file();
    return status;
}

/**
 * @brief Client mode: `(R)egister` loops back to the menu, `(L)ogin` enters the chat.
 */
int run_client(const parley::infra::Config& config)
{
    parley::auth::CredentialStore store(config.users_file);

    // Creates an empty store on first run and fails fast on a corrupt one.
    std::map<std::string, std::string> users = store.load();
    Logger::log(LogLevel::DEBUG, "Auth: " + std::to_string(users.size()) +
                                     " registered user(s) in '" + config.users_file + "'.");

    std::string choice;

    while (prompt_line("Do you want to (R)egister or (L)ogin? ", choice)) {
        choice = parley::infra::String::to_lower(choice);

        if (choice == "r") {
            std::string username;
            std::string password;
            if (!prompt_line("Choose a username: ", username) ||
                !prompt_line("Choose a password: ", password)) {
                return 0;
            }
            if (store.register_user(username, password)) {
                std::cout << "Registration successful! You can now log in." << std::endl;
            } else {
                std::cout << "Username already exists! Try again." << std::endl;
            }
        } else if (choice == "l") {
            std::string username;
            std::string password;
            while (true) {
                if (!prompt_line("Enter your username: ", username) ||
                    !prompt_line("Enter your password: ", password)) {
                    return 0;
                }
                if (store.authenticate(username, password)) {
                    std::cout << "Login successful!" << std::endl;
                    break;
                }
                std::cout << "Invalid username or password! Try again." << std::endl;
            }

            parley::network::Client client(config.host, config.port);
            return client.chat(username, std::cin, std::cout) ? 0 : 1;
        }
    }
    return 0;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::string config_path = (argc > 1) ? argv[1] : "config.json";

    try {
        parley::infra::Config config = parley::infra::Config::load(config_path);

        std::string mode;
        if (!prompt_line("Start as server (s) or client (c)? ", mode)) {
            return 0;
        }
        mode = parley::infra::String::to_lower(mode);

        if (mode == "s") {
            Logger::log(LogLevel::INFO, "System: Booting Parley chat server...");
            return run_server(config);
        }
        if (mode == "c") {
            // Keep diagnostics from painting over the chat prompt.
            Logger::set_level(LogLevel::WARN);
            return run_client(config);
        }

        std::cout << "Unknown mode '" << mode << "'. Expected 's' or 'c'." << std::endl;
        return 1;

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }
}
