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
 * @file credential_store.hpp
 * @brief File-backed username/password store used by the client before connecting.
 *
 * @details
 * Credentials live in a flat JSON object mapping each username to the hex-encoded
 * SHA-256 digest of its password:
 *
 * @code
 * { "alice": "5e884898da28047151d0e56f8dc6292773603d0d6aabbdd62a11ef721d1542d8" }
 * @endcode
 *
 * Plain passwords are never written to disk. The store is reloaded on every call, so
 * several client processes sharing one file observe each other's registrations.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace parley::auth {

/**
 * @class CredentialStore
 * @brief Load/mutate/persist contract over the user file.
 *
 * @details
 * **Durability and Exclusion:**
 * 1. Every read-modify-write holds an exclusive `flock()` on `<path>.lock` for its full
 *    duration; the lock is a scoped guard released on every exit path.
 * 2. The new content is written to `<path>.tmp` and renamed over the target, so readers
 *    only ever see the old file or the complete new one.
 */
class CredentialStore {
  public:
    /// @param path Location of the JSON user file, e.g. `users.json`.
    explicit CredentialStore(std::string path);

    /**
     * @brief Reads all credentials under the file lock. A missing file is created empty.
     *
     * @return Username -> password hash.
     * @throws std::runtime_error If the file exists but is not a JSON object of strings,
     * or cannot be created.
     */
    std::map<std::string, std::string> load() const;

    /**
     * @brief Adds a user.
     *
     * @return false If `username` is empty or already registered; true once persisted.
     * @throws std::runtime_error If the file cannot be read, locked or written.
     */
    bool register_user(const std::string& username, const std::string& password);

    /**
     * @brief Verifies a username/password pair.
     *
     * @return true Only if the user exists and the password hash matches.
     */
    bool authenticate(const std::string& username, const std::string& password) const;

    /**
     * @brief Hex-encoded SHA-256 digest (64 lowercase characters).
     *
     * @code
     * CredentialStore::hash_password("") ==
     *     "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
     * @endcode
     */
    static std::string hash_password(const std::string& password);

  private:
    /// @brief Parses the user file; `std::nullopt` if it does not exist.
    std::optional<std::map<std::string, std::string>> read_users() const;

    /// @brief Writes the whole map via temp file + rename. Caller holds the file lock.
    void persist(const std::map<std::string, std::string>& users) const;

    std::string path_;
};

} // namespace parley::auth
