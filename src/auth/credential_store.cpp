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
 * @file credential_store.cpp
 * @brief cJSON + OpenSSL implementation of the credential store.
 */

#include "parley/auth/credential_store.hpp"

#include "parley/infra/logger.hpp"

#include <cJSON.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace parley::auth {

namespace {

/**
 * @class FileLock
 * @brief RAII exclusive advisory lock on a side file.
 *
 * Locking a dedicated `.lock` file instead of the data file keeps the lock valid across
 * the rename that replaces the data file.
 */
class FileLock {
  public:
    explicit FileLock(const std::string& path) : fd_(::open(path.c_str(), O_RDWR | O_CREAT, 0644))
    {
        if (fd_ < 0) {
            throw std::runtime_error("Auth: cannot open lock file '" + path +
                                     "': " + std::strerror(errno));
        }
        while (flock(fd_, LOCK_EX) < 0) {
            if (errno != EINTR) {
                int err = errno;
                ::close(fd_);
                throw std::runtime_error("Auth: cannot lock '" + path + "': " + std::strerror(err));
            }
        }
    }

    ~FileLock()
    {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

  private:
    int fd_;
};

} // namespace

CredentialStore::CredentialStore(std::string path) : path_(std::move(path)) {}

std::string CredentialStore::hash_password(const std::string& password)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(password.data(), password.size(), digest, &digest_len, EVP_sha256(),
                   nullptr) != 1) {
        throw std::runtime_error("Auth: SHA-256 digest failed");
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::optional<std::map<std::string, std::string>> CredentialStore::read_users() const
{
    std::ifstream file(path_);
    if (!file.is_open()) {
        if (fs::exists(path_)) {
            throw std::runtime_error("Auth: cannot read '" + path_ + "'");
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string raw = buffer.str();

    cJSON* root = cJSON_Parse(raw.c_str());
    if (!root || !cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw std::runtime_error("Auth: '" + path_ + "' is not a valid user store");
    }

    std::map<std::string, std::string> users;
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, root)
    {
        if (!entry->string || !cJSON_IsString(entry) || !entry->valuestring) {
            cJSON_Delete(root);
            throw std::runtime_error("Auth: '" + path_ + "' contains a non-string entry");
        }
        users[entry->string] = entry->valuestring;
    }

    cJSON_Delete(root);
    return users;
}

std::map<std::string, std::string> CredentialStore::load() const
{
    FileLock lock(path_ + ".lock");

    if (auto users = read_users()) {
        return *users;
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Auth: '" + path_ + "' not found. Creating an empty user store.");
    std::map<std::string, std::string> empty;
    persist(empty);
    return empty;
}

/**
 * @brief Registers a user under the exclusive file lock.
 *
 * The whole read-check-write cycle runs under the lock, so two processes registering
 * the same name concurrently cannot both succeed.
 */
bool CredentialStore::register_user(const std::string& username, const std::string& password)
{
    if (username.empty()) {
        return false;
    }

    FileLock lock(path_ + ".lock");

    std::map<std::string, std::string> users;
    if (auto existing = read_users()) {
        users = std::move(*existing);
    }
    if (users.count(username)) {
        return false;
    }

    users[username] = hash_password(password);
    persist(users);

    infra::Logger::log(infra::LogLevel::INFO, "Auth: Registered user '" + username + "'.");
    return true;
}

bool CredentialStore::authenticate(const std::string& username, const std::string& password) const
{
    std::optional<std::map<std::string, std::string>> users = read_users();
    if (!users) {
        return false;
    }

    auto it = users->find(username);
    return it != users->end() && it->second == hash_password(password);
}

/**
 * @brief Atomic snapshot write.
 *
 * 1. **Serialize:** Build the JSON object with cJSON.
 * 2. **Stage:** Write it to `<path>.tmp` and check the stream state.
 * 3. **Swap:** `fs::rename` the staged file over the live one.
 */
void CredentialStore::persist(const std::map<std::string, std::string>& users) const
{
    cJSON* root = cJSON_CreateObject();
    for (const auto& [name, hash] : users) {
        cJSON_AddStringToObject(root, name.c_str(), hash.c_str());
    }

    char* raw = cJSON_Print(root);
    cJSON_Delete(root);
    if (!raw) {
        throw std::runtime_error("Auth: failed to serialize user store");
    }

    std::string temp_path = path_ + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (file.is_open()) {
            file << raw << '\n';
        }
        free(raw);

        file.flush();
        if (!file.good()) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            throw std::runtime_error("Auth: failed to write '" + temp_path + "'");
        }
    }

    try {
        fs::rename(temp_path, path_);
    } catch (const fs::filesystem_error& e) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw std::runtime_error("Auth: failed to replace '" + path_ + "': " + e.what());
    }
}

} // namespace parley::auth
