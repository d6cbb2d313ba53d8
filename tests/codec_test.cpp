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
 * @file codec_test.cpp
 * @brief Wire-level tests for frame encoding, reassembly and payload classification.
 *
 * @details
 * TCP delivers a byte stream, not messages. These tests feed the decoder the way a
 * socket would: in arbitrary slices, several frames at once, or one byte at a time.
 */

#include "framework.hpp"
#include "parley/infra/error.hpp"
#include "parley/protocol/codec.hpp"
#include "parley/protocol/message.hpp"

#include <optional>
#include <string>
#include <variant>

using parley::protocol::FrameDecoder;
namespace protocol = parley::protocol;

/**
 * @brief The header is the big-endian payload length.
 */
void test_encode_header_layout()
{
    std::string frame = protocol::encode("hello");

    ASSERT_EQ(frame.size(), protocol::kHeaderSize + 5);
    ASSERT_EQ(static_cast<int>(frame[0]), 0);
    ASSERT_EQ(static_cast<int>(frame[1]), 0);
    ASSERT_EQ(static_cast<int>(frame[2]), 0);
    ASSERT_EQ(static_cast<int>(frame[3]), 5);
    ASSERT_EQ(frame.substr(protocol::kHeaderSize), std::string("hello"));
}

/**
 * @brief Payload bytes are opaque: NULs and header-shaped bytes survive intact.
 */
void test_decode_binary_payload()
{
    std::string payload("a\0b", 3);
    payload += std::string("\x00\x00\x00\x09", 4);

    FrameDecoder decoder;
    decoder.feed(protocol::encode(payload));

    std::optional<std::string> out = decoder.next();
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(*out, payload);
    ASSERT_EQ(decoder.buffered(), static_cast<size_t>(0));
}

/**
 * @brief A frame delivered one byte at a time is yielded exactly once, at the end.
 */
void test_decode_byte_by_byte()
{
    std::string frame = protocol::encode("split across reads");
    FrameDecoder decoder;

    for (size_t i = 0; i + 1 < frame.size(); ++i) {
        decoder.feed(&frame[i], 1);
        ASSERT_FALSE(decoder.next().has_value());
    }
    decoder.feed(&frame[frame.size() - 1], 1);

    std::optional<std::string> out = decoder.next();
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(*out, std::string("split across reads"));
}

/**
 * @brief Several frames coalesced into one read come out in order.
 */
void test_decode_coalesced_frames()
{
    std::string stream = protocol::encode("one") + protocol::encode("") + protocol::encode("three");
    FrameDecoder decoder;

    // Leave the last frame incomplete to check that the tail is retained.
    decoder.feed(stream.data(), stream.size() - 2);

    ASSERT_EQ(*decoder.next(), std::string("one"));
    ASSERT_EQ(*decoder.next(), std::string(""));
    ASSERT_FALSE(decoder.next().has_value());

    decoder.feed(stream.data() + stream.size() - 2, 2);
    ASSERT_EQ(*decoder.next(), std::string("three"));
    ASSERT_FALSE(decoder.next().has_value());
}

/**
 * @brief Oversized payloads are refused on both sides of the wire.
 *
 * The decoder must reject a hostile header before the body arrives, otherwise a
 * peer could make the server buffer arbitrary amounts of data.
 */
void test_frame_size_limit()
{
    std::string largest(protocol::kMaxPayloadSize, 'x');
    ASSERT_EQ(protocol::encode(largest).size(), protocol::kHeaderSize + largest.size());

    std::string too_large(protocol::kMaxPayloadSize + 1, 'x');
    ASSERT_THROWS(protocol::encode(too_large), parley::FramingError);

    FrameDecoder decoder;
    decoder.feed(std::string("\x7f\xff\xff\xff", 4));
    ASSERT_THROWS(decoder.next(), parley::FramingError);
}

/**
 * @brief A payload is a command when it starts with a keyword.
 *
 * Keywords are tried as prefixes in catalog order; anything else, including other
 * slash words, is ordinary chat text.
 */
void test_parse_commands()
{
    protocol::Message help = protocol::parse("/help");
    ASSERT_TRUE(std::holds_alternative<protocol::Command>(help));
    ASSERT_TRUE(std::get<protocol::Command>(help).name == protocol::CommandName::HELP);

    protocol::Message priv = protocol::parse("/private bob see you at 5");
    ASSERT_TRUE(std::holds_alternative<protocol::Command>(priv));
    ASSERT_TRUE(std::get<protocol::Command>(priv).name == protocol::CommandName::PRIVATE);
    ASSERT_EQ(std::get<protocol::Command>(priv).args, std::string("bob see you at 5"));

    // Keyword prefixes still select the command.
    protocol::Message helpme = protocol::parse("/helpme");
    ASSERT_TRUE(std::holds_alternative<protocol::Command>(helpme));
    ASSERT_TRUE(std::get<protocol::Command>(helpme).name == protocol::CommandName::HELP);

    protocol::Message lister = protocol::parse("/listusers now");
    ASSERT_TRUE(std::holds_alternative<protocol::Command>(lister));
    ASSERT_TRUE(std::get<protocol::Command>(lister).name == protocol::CommandName::LIST);

    protocol::Message glued = protocol::parse("/privatebob hi");
    ASSERT_TRUE(std::holds_alternative<protocol::Command>(glued));
    ASSERT_TRUE(std::get<protocol::Command>(glued).name == protocol::CommandName::PRIVATE);
    ASSERT_EQ(std::get<protocol::Command>(glued).args, std::string("hi"));

    ASSERT_TRUE(std::get<protocol::Command>(protocol::parse("/statsx")).name ==
                protocol::CommandName::STATS);

    // Everything else is ordinary chat text.
    ASSERT_TRUE(std::holds_alternative<protocol::PlainText>(protocol::parse("/HELP")));
    ASSERT_TRUE(std::holds_alternative<protocol::PlainText>(protocol::parse("/quit")));
    ASSERT_TRUE(std::holds_alternative<protocol::PlainText>(protocol::parse("/he")));
    ASSERT_TRUE(std::holds_alternative<protocol::PlainText>(protocol::parse(" /list")));

    protocol::Message text = protocol::parse("hello world");
    ASSERT_EQ(std::get<protocol::PlainText>(text).body, std::string("hello world"));
}

void test_render_notice()
{
    ASSERT_EQ(protocol::render(protocol::SystemNotice{"alice has joined the chat."}),
              std::string("[SERVER] alice has joined the chat."));
}
