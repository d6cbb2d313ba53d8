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
 * @file error.hpp
 * @brief Exception taxonomy for the Parley chat service.
 *
 * @details
 * Every failure that crosses a component boundary is reported as a subclass of
 * `parley::Error`. Session workers catch these per connection, so an error raised
 * while serving one client never reaches the accept loop or another session.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace parley {

/**
 * @class Error
 * @brief Root of all Parley exceptions.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class FramingError
 * @brief A frame on the wire was malformed or exceeded the maximum payload size.
 *
 * The offending connection is closed; other connections are unaffected.
 */
class FramingError : public Error {
  public:
    explicit FramingError(const std::string& what) : Error("Framing: " + what) {}
};

/**
 * @class TransportError
 * @brief The underlying socket failed (reset, broken pipe, timeout, refused).
 */
class TransportError : public Error {
  public:
    explicit TransportError(const std::string& what) : Error("Transport: " + what) {}
};

/**
 * @class InvariantViolation
 * @brief Internal consistency failure. Fatal to the affected connection only.
 */
class InvariantViolation : public Error {
  public:
    explicit InvariantViolation(const std::string& what) : Error("Invariant: " + what) {}
};

/// @brief A session id was registered twice.
class DuplicateConnection : public InvariantViolation {
  public:
    explicit DuplicateConnection(const std::string& id)
        : InvariantViolation("connection '" + id + "' is already registered")
    {
    }
};

/// @brief An operation referenced a session id that is not registered.
class UnknownSession : public InvariantViolation {
  public:
    explicit UnknownSession(const std::string& id)
        : InvariantViolation("session '" + id + "' is not registered")
    {
    }
};

/**
 * @class DuplicateUsername
 * @brief A username is already bound to another live session.
 */
class DuplicateUsername : public Error {
  public:
    explicit DuplicateUsername(const std::string& name)
        : Error("Username '" + name + "' is already in use"), username_(name)
    {
    }

    const std::string& username() const { return username_; }

  private:
    std::string username_;
};

/**
 * @class ConfigError
 * @brief The configuration file exists but cannot be used.
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string& what) : Error("Config: " + what) {}
};

} // namespace parley
