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
 * @file registry.cpp
 * @brief Implementation of the live-session directory.
 *
 * @details
 * Lock ordering: the registry lock may be held while a session's own state mutex is
 * taken (to bind or read its username), never the other way around.
 */

#include "parley/chat/registry.hpp"

#include "parley/infra/error.hpp"

#include <algorithm>
#include <mutex>

namespace parley::chat {

void Registry::register_session(SessionPtr session)
{
    std::unique_lock lock(rw_lock_);

    const std::string& id = session->id();
    if (by_id_.count(id)) {
        throw DuplicateConnection(id);
    }

    by_id_.emplace(id, session);
    sessions_.push_back(std::move(session));
}

void Registry::bind_username(const std::string& session_id, const std::string& username)
{
    std::unique_lock lock(rw_lock_);

    auto it = by_id_.find(session_id);
    if (it == by_id_.end()) {
        throw UnknownSession(session_id);
    }

    auto taken = by_username_.find(username);
    if (taken != by_username_.end() && taken->second != it->second) {
        throw DuplicateUsername(username);
    }

    it->second->bind(username);
    by_username_[username] = it->second;
}

bool Registry::remove(const std::string& session_id)
{
    std::unique_lock lock(rw_lock_);

    auto it = by_id_.find(session_id);
    if (it == by_id_.end()) {
        return false;
    }

    SessionPtr session = it->second;
    by_id_.erase(it);

    sessions_.erase(std::remove(sessions_.begin(), sessions_.end(), session), sessions_.end());

    // Only drop the index entry if it still points at this session.
    if (auto name = session->username()) {
        auto indexed = by_username_.find(*name);
        if (indexed != by_username_.end() && indexed->second == session) {
            by_username_.erase(indexed);
        }
    }
    return true;
}

std::vector<SessionPtr> Registry::snapshot() const
{
    std::shared_lock lock(rw_lock_);
    return sessions_;
}

SessionPtr Registry::find_by_username(const std::string& username) const
{
    std::shared_lock lock(rw_lock_);
    auto it = by_username_.find(username);
    return (it != by_username_.end()) ? it->second : nullptr;
}

SessionPtr Registry::find(const std::string& session_id) const
{
    std::shared_lock lock(rw_lock_);
    auto it = by_id_.find(session_id);
    return (it != by_id_.end()) ? it->second : nullptr;
}

size_t Registry::size() const
{
    std::shared_lock lock(rw_lock_);
    return by_id_.size();
}

} // namespace parley::chat
