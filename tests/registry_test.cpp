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
 * @file registry_test.cpp
 * @brief Unit tests for the session directory and the session state machine.
 *
 * @details
 * Sessions here wrap a detached connection (descriptor -1): the registry never
 * touches the socket, so no network is needed.
 */

#include "framework.hpp"
#include "parley/chat/registry.hpp"
#include "parley/infra/error.hpp"

#include <memory>
#include <string>
#include <vector>

using parley::chat::Registry;
using parley::chat::Session;
using parley::chat::SessionPtr;

namespace {

SessionPtr detached_session(const std::string& id)
{
    return std::make_shared<Session>(id, std::make_unique<parley::network::Connection>(-1, id));
}

} // namespace

/**
 * @brief A connection id may only be registered once.
 */
void test_registry_rejects_duplicate_connection()
{
    Registry registry;
    registry.register_session(detached_session("conn-1"));

    ASSERT_THROWS(registry.register_session(detached_session("conn-1")),
                  parley::DuplicateConnection);
    ASSERT_EQ(registry.size(), static_cast<size_t>(1));
}

/**
 * @brief Binding moves the session to IDENTIFIED and indexes it by name.
 */
void test_registry_bind_username()
{
    Registry registry;
    SessionPtr session = detached_session("conn-1");
    registry.register_session(session);

    ASSERT_TRUE(session->state() == Session::State::CONNECTED);
    ASSERT_FALSE(session->username().has_value());

    registry.bind_username("conn-1", "alice");

    ASSERT_TRUE(session->state() == Session::State::IDENTIFIED);
    ASSERT_EQ(*session->username(), std::string("alice"));
    ASSERT_TRUE(registry.find_by_username("alice") == session);
    ASSERT_TRUE(registry.find_by_username("bob") == nullptr);
}

/**
 * @brief Usernames are unique among live sessions.
 *
 * The losing session stays CONNECTED and unnamed; the name becomes available again
 * once its holder leaves.
 */
void test_registry_rejects_duplicate_username()
{
    Registry registry;
    SessionPtr first = detached_session("conn-1");
    SessionPtr second = detached_session("conn-2");
    registry.register_session(first);
    registry.register_session(second);

    registry.bind_username("conn-1", "alice");
    ASSERT_THROWS(registry.bind_username("conn-2", "alice"), parley::DuplicateUsername);
    ASSERT_TRUE(second->state() == Session::State::CONNECTED);
    ASSERT_TRUE(registry.find_by_username("alice") == first);

    ASSERT_TRUE(registry.remove("conn-1"));
    registry.bind_username("conn-2", "alice");
    ASSERT_TRUE(registry.find_by_username("alice") == second);
}

void test_registry_unknown_session()
{
    Registry registry;
    ASSERT_THROWS(registry.bind_username("conn-404", "ghost"), parley::UnknownSession);
}

/**
 * @brief A session can bind a username only once.
 */
void test_registry_rebind_is_invariant_violation()
{
    Registry registry;
    registry.register_session(detached_session("conn-1"));
    registry.bind_username("conn-1", "alice");

    ASSERT_THROWS(registry.bind_username("conn-1", "alice2"), parley::InvariantViolation);
    ASSERT_TRUE(registry.find_by_username("alice2") == nullptr);
}

/**
 * @brief Removing twice is harmless; only the first call reports a removal.
 */
void test_registry_remove_idempotent()
{
    Registry registry;
    registry.register_session(detached_session("conn-1"));
    registry.bind_username("conn-1", "alice");

    ASSERT_TRUE(registry.remove("conn-1"));
    ASSERT_FALSE(registry.remove("conn-1"));
    ASSERT_FALSE(registry.remove("conn-404"));

    ASSERT_EQ(registry.size(), static_cast<size_t>(0));
    ASSERT_TRUE(registry.find("conn-1") == nullptr);
    ASSERT_TRUE(registry.find_by_username("alice") == nullptr);
}

/**
 * @brief Snapshots list sessions in join order and are unaffected by later changes.
 */
void test_registry_snapshot_order()
{
    Registry registry;
    registry.register_session(detached_session("conn-1"));
    registry.register_session(detached_session("conn-2"));
    registry.register_session(detached_session("conn-3"));

    std::vector<SessionPtr> before = registry.snapshot();
    registry.remove("conn-2");
    std::vector<SessionPtr> after = registry.snapshot();

    ASSERT_EQ(before.size(), static_cast<size_t>(3));
    ASSERT_EQ(before[1]->id(), std::string("conn-2"));

    ASSERT_EQ(after.size(), static_cast<size_t>(2));
    ASSERT_EQ(after[0]->id(), std::string("conn-1"));
    ASSERT_EQ(after[1]->id(), std::string("conn-3"));
}

/**
 * @brief Closing is a one-way transition and only the first call performs it.
 */
void test_session_close_transition()
{
    SessionPtr session = detached_session("conn-1");

    ASSERT_TRUE(session->close());
    ASSERT_FALSE(session->close());
    ASSERT_TRUE(session->state() == Session::State::CLOSED);

    ASSERT_THROWS(session->send("late"), parley::TransportError);
    ASSERT_FALSE(session->receive().has_value());

    Registry registry;
    registry.register_session(session);
    ASSERT_THROWS(registry.bind_username("conn-1", "alice"), parley::InvariantViolation);
}

/**
 * @brief The join time is stamped at construction and drives the connected duration.
 */
void test_session_join_clock()
{
    Session::Clock::time_point before = Session::Clock::now();
    SessionPtr session = detached_session("conn-1");
    Session::Clock::time_point after = Session::Clock::now();

    ASSERT_TRUE(session->joined_at() >= before);
    ASSERT_TRUE(session->joined_at() <= after);
    ASSERT_TRUE(session->connected_seconds() < 5);
}
