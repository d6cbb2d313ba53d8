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
 * @file registry.hpp
 * @brief Concurrency-safe directory of live sessions.
 *
 * @details
 * This header declares the `Registry` class, the single authoritative view of who is
 * connected. Every session worker registers on accept, binds its username after the
 * handshake and removes itself on close; the router reads it to address messages.
 * The underlying containers are never exposed: readers receive immutable snapshots.
 */

#pragma once

#include "parley/chat/session.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace parley::chat {

using SessionPtr = std::shared_ptr<Session>;

/**
 * @class Registry
 * @brief Join-ordered session table with a username index.
 *
 * @details
 * **Concurrency Control:** Utilizes `std::shared_mutex` as a Reader-Writer lock.
 * - Mutations (`register_session`, `bind_username`, `remove`) take the writer lock.
 * - Reads (`snapshot`, `find_by_username`, `size`) take the reader lock and copy out
 *   shared pointers, so message delivery never happens while the lock is held.
 *
 * **Invariants:**
 * - A username maps to at most one live session.
 * - Every username index entry refers to a session present in the primary table.
 */
class Registry {
  public:
    /**
     * @brief Adds a freshly accepted session at the end of the join order.
     *
     * @throws parley::DuplicateConnection If a session with the same id is registered.
     * @note Acquires a **Writer Lock** (Exclusive).
     */
    void register_session(SessionPtr session);

    /**
     * @brief Binds `username` to a registered session and moves it to `IDENTIFIED`.
     *
     * @throws parley::UnknownSession If `session_id` is not registered.
     * @throws parley::DuplicateUsername If another live session already uses the name.
     * @note Acquires a **Writer Lock** (Exclusive).
     */
    void bind_username(const std::string& session_id, const std::string& username);

    /**
     * @brief Removes a session from the table and the username index.
     *
     * @return true If the session was registered, false if it was already absent.
     * @note Idempotent. Acquires a **Writer Lock** (Exclusive).
     */
    bool remove(const std::string& session_id);

    /**
     * @brief Point-in-time copy of all registered sessions, in join order.
     * @note Acquires a **Reader Lock** (Shared).
     */
    std::vector<SessionPtr> snapshot() const;

    /**
     * @brief Looks up the live session bound to `username`.
     * @return The session, or `nullptr` if nobody uses that name.
     */
    SessionPtr find_by_username(const std::string& username) const;

    /// @brief Looks up a session by id, or `nullptr`.
    SessionPtr find(const std::string& session_id) const;

    /// @brief Number of registered sessions (identified or not).
    size_t size() const;

  private:
    mutable std::shared_mutex rw_lock_;

    /// @brief Primary table in join order.
    std::vector<SessionPtr> sessions_;

    /// @brief Session id -> session. O(1) duplicate detection and removal lookup.
    std::unordered_map<std::string, SessionPtr> by_id_;

    /// @brief Username -> session. O(1) private-message addressing.
    std::unordered_map<std::string, SessionPtr> by_username_;
};

} // namespace parley::chat
