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
 * @file codec.hpp
 * @brief Length-prefixed framing for the chat wire protocol.
 *
 * @details
 * TCP delivers a byte stream, not messages: one `recv()` may return half a message,
 * exactly one, or several glued together. Every application message is therefore
 * carried in a **Binary Length-Prefixed Frame**:
 *
 * `[4-byte Big Endian Length Header] + [N-byte UTF-8 Payload]`
 *
 * The payload is opaque to the framing layer, so any byte sequence (including NUL
 * bytes and bytes that look like headers) survives a round trip unchanged.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace parley::protocol {

/// @brief Size of the length header in bytes.
constexpr size_t kHeaderSize = 4;

/// @brief Largest payload accepted in either direction (64 KiB).
constexpr uint32_t kMaxPayloadSize = 64 * 1024;

/**
 * @brief Wraps a payload into a single frame.
 *
 * @param payload The message text.
 * @return std::string Header followed by the payload bytes.
 * @throws parley::FramingError If the payload exceeds `kMaxPayloadSize`.
 */
std::string encode(const std::string& payload);

/**
 * @class FrameDecoder
 * @brief Incremental, per-connection frame reassembler.
 *
 * @details
 * Transport chunks are appended with `feed()`; complete payloads are pulled with
 * `next()` in arrival order. Bytes of an unfinished frame stay buffered until more
 * data arrives. One decoder belongs to exactly one connection and is discarded
 * together with it, so a partial frame pending at close is dropped, never replayed.
 *
 * @code
 * FrameDecoder decoder;
 * decoder.feed(chunk, n);
 * while (auto msg = decoder.next()) {
 *     handle(*msg);
 * }
 * @endcode
 */
class FrameDecoder {
  public:
    /// @brief Appends raw bytes received from the transport.
    void feed(const char* data, size_t size);

    /// @copydoc feed(const char*, size_t)
    void feed(const std::string& bytes);

    /**
     * @brief Extracts the next complete payload, if one is fully buffered.
     *
     * @return The payload, or `std::nullopt` when more bytes are needed.
     * @throws parley::FramingError When the pending header announces a payload larger
     * than `kMaxPayloadSize`. The check happens as soon as the header is complete, so an
     * oversized frame is rejected without waiting for its body.
     */
    std::optional<std::string> next();

    /// @brief Number of bytes held for frames not yet complete.
    size_t buffered() const { return buffer_.size() - offset_; }

  private:
    std::string buffer_;

    /// @brief Read position inside `buffer_`; consumed bytes are compacted lazily.
    size_t offset_ = 0;
};

} // namespace parley::protocol
