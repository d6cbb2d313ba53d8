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
 * @file auth_test.cpp
 * @brief Persistence tests for the client-side credential store.
 */

#include "framework.hpp"
#include "parley/auth/credential_store.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using parley::auth::CredentialStore;

namespace {

/**
 * @brief Returns a fresh store path, removing leftovers from earlier runs.
 */
std::string scratch_store(const std::string& name)
{
    fs::path path = fs::temp_directory_path() / ("parley_auth_" + name + ".json");
    std::error_code ec;
    fs::remove(path, ec);
    fs::remove(path.string() + ".lock", ec);
    fs::remove(path.string() + ".tmp", ec);
    return path.string();
}

void cleanup(const std::string& path)
{
    std::error_code ec;
    fs::remove(path, ec);
    fs::remove(path + ".lock", ec);
}

} // namespace

/**
 * @brief Passwords are stored as lowercase hex SHA-256 digests.
 */
void test_auth_hash_known_vector()
{
    ASSERT_EQ(CredentialStore::hash_password("abc"),
              std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    ASSERT_EQ(CredentialStore::hash_password("").size(), static_cast<size_t>(64));
}

void test_auth_register_and_login()
{
    std::string path = scratch_store("login");
    CredentialStore store(path);

    ASSERT_TRUE(store.register_user("alice", "s3cret"));
    ASSERT_TRUE(store.authenticate("alice", "s3cret"));
    ASSERT_FALSE(store.authenticate("alice", "wrong"));
    ASSERT_FALSE(store.authenticate("bob", "s3cret"));

    // The plaintext never reaches the disk.
    std::map<std::string, std::string> users = store.load();
    ASSERT_EQ(users.size(), static_cast<size_t>(1));
    ASSERT_EQ(users["alice"], CredentialStore::hash_password("s3cret"));

    cleanup(path);
}

/**
 * @brief Existing and empty usernames are refused without touching stored entries.
 */
void test_auth_register_rejects_duplicates()
{
    std::string path = scratch_store("duplicates");
    CredentialStore store(path);

    ASSERT_TRUE(store.register_user("alice", "first"));
    ASSERT_FALSE(store.register_user("alice", "second"));
    ASSERT_FALSE(store.register_user("", "nobody"));

    ASSERT_TRUE(store.authenticate("alice", "first"));
    ASSERT_FALSE(store.authenticate("alice", "second"));

    cleanup(path);
}

/**
 * @brief Registrations survive a new store instance (i.e. a client restart).
 */
void test_auth_persistence()
{
    std::string path = scratch_store("persist");
    {
        CredentialStore writer(path);
        ASSERT_TRUE(writer.register_user("alice", "a"));
        ASSERT_TRUE(writer.register_user("bob", "b"));
    }

    CredentialStore reader(path);
    ASSERT_TRUE(reader.authenticate("bob", "b"));
    ASSERT_TRUE(reader.authenticate("alice", "a"));
    ASSERT_FALSE(fs::exists(path + ".tmp"));

    cleanup(path);
}

/**
 * @brief A missing store denies every login and is created empty on load.
 */
void test_auth_missing_store()
{
    std::string path = scratch_store("missing");
    CredentialStore store(path);

    ASSERT_FALSE(store.authenticate("alice", "a"));
    ASSERT_FALSE(fs::exists(path));

    ASSERT_TRUE(store.load().empty());
    ASSERT_TRUE(fs::exists(path));

    cleanup(path);
}

/**
 * @brief A corrupt store is reported, never silently replaced with an empty one.
 */
void test_auth_corrupt_store()
{
    std::string path = scratch_store("corrupt");
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    CredentialStore store(path);

    ASSERT_THROWS(store.load(), std::runtime_error);
    ASSERT_THROWS(store.register_user("alice", "a"), std::runtime_error);

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_EQ(contents, std::string("{ not json"));

    cleanup(path);
}
