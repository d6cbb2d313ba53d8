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
 * @file codec.cpp
 * @brief Implementation of the length-prefixed frame codec.
 *
 * @details
 * The header is written in network byte order so peers on different architectures
 * agree on payload lengths.
 */

#include "parley/protocol/codec.hpp"

#include "parley/infra/error.hpp"

#include <arpa/inet.h>
#include <cstring>

namespace parley::protocol {

std::string encode(const std::string& payload)
{
    if (payload.size() > kMaxPayloadSize) {
        throw FramingError("payload of " + std::to_string(payload.size()) +
                           " bytes exceeds the " + std::to_string(kMaxPayloadSize) +
                           " byte limit");
    }

    uint32_t length = htonl(static_cast<uint32_t>(payload.size()));

    std::string frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.append(reinterpret_cast<const char*>(&length), kHeaderSize);
    frame.append(payload);
    return frame;
}

void FrameDecoder::feed(const char* data, size_t size)
{
    // Drop bytes already consumed by next() before growing the buffer.
    if (offset_ > 0) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    buffer_.append(data, size);
}

void FrameDecoder::feed(const std::string& bytes)
{
    feed(bytes.data(), bytes.size());
}

/**
 * @brief Pulls one frame out of the reassembly buffer.
 *
 * Implements the frame reader in two steps:
 * 1. **Header:** Wait for 4 bytes, decode the length and validate it.
 * 2. **Body:** Wait for the announced number of bytes and slice them out.
 */
std::optional<std::string> FrameDecoder::next()
{
    if (buffered() < kHeaderSize) {
        return std::nullopt;
    }

    uint32_t length = 0;
    std::memcpy(&length, buffer_.data() + offset_, kHeaderSize);
    length = ntohl(length);

    if (length > kMaxPayloadSize) {
        throw FramingError("announced payload of " + std::to_string(length) +
                           " bytes exceeds the " + std::to_string(kMaxPayloadSize) +
                           " byte limit");
    }

    if (buffered() < kHeaderSize + length) {
        return std::nullopt;
    }

    std::string payload = buffer_.substr(offset_ + kHeaderSize, length);
    offset_ += kHeaderSize + length;

    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    return payload;
}

} // namespace parley::protocol
