#include <gtest/gtest.h>
#include <functional>
#include <sstream>
#include "protocol/codec.hpp"
#include "protocol/payloads.hpp"
#include "test_utils.hpp"

using namespace lbft::protocol;

class CodecTest : public ::testing::Test {
protected:
    Codec codec;

    // Helper to build a raw header with an arbitrary version, type and length
    static std::vector<uint8_t> raw_header(uint8_t version, uint8_t type, uint32_t length) {
        return {
            version, type,
            static_cast<uint8_t>(length >> 24), static_cast<uint8_t>(length >> 16),
            static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length)
          };
    }

    void expect_kind(const std::function<void()>& action, ErrorKind expected) {
        try {
            action();
            FAIL() << "Expected ProtocolError " << expected;
        } catch (const ProtocolError& e) {
            EXPECT_EQ(e.kind(), expected) << e.what();
        }
    }
};

TEST_F(CodecTest, HeaderLayout) {
    ProtocolMessage message(MessageType::FILE_CHUNK, {0xAA, 0xBB, 0xCC});
    auto bytes = codec.encode(message);

    ASSERT_EQ(bytes.size(), HEADER_SIZE + 3);
    EXPECT_EQ(bytes[0], WIRE_VERSION);
    EXPECT_EQ(bytes[1], 0x05);
    // Length in network byte order
    EXPECT_EQ(bytes[2], 0x00);
    EXPECT_EQ(bytes[3], 0x00);
    EXPECT_EQ(bytes[4], 0x00);
    EXPECT_EQ(bytes[5], 0x03);
    EXPECT_EQ(bytes[6], 0xAA);
    EXPECT_EQ(bytes[8], 0xCC);
}

TEST_F(CodecTest, EncodeDecodePreservesMessage) {
    ProtocolMessage message(MessageType::FILE_METADATA, lbft::test::random_bytes(1000));
    ProtocolMessage decoded = codec.decode(codec.encode(message));

    EXPECT_EQ(decoded.version, WIRE_VERSION);
    EXPECT_EQ(decoded.type, MessageType::FILE_METADATA);
    EXPECT_EQ(decoded.payload, message.payload);
}

TEST_F(CodecTest, EmptyPayload) {
    ProtocolMessage message(MessageType::LIST_REQUEST);
    auto bytes = codec.encode(message);
    ASSERT_EQ(bytes.size(), HEADER_SIZE);

    ProtocolMessage decoded = codec.decode(bytes);
    EXPECT_EQ(decoded.type, MessageType::LIST_REQUEST);
    EXPECT_TRUE(decoded.payload.empty());
}

TEST_F(CodecTest, ErrorTypeUsesHighCode) {
    auto bytes = codec.encode(make_error_message(ErrorKind::FILE_NOT_FOUND, "missing"));
    EXPECT_EQ(bytes[1], 0xFF);
}

TEST_F(CodecTest, UnknownTypeIsMalformed) {
    auto bytes = raw_header(WIRE_VERSION, 0x42, 0);
    expect_kind([&]() { codec.decode(bytes); }, ErrorKind::MALFORMED_MESSAGE);
}

TEST_F(CodecTest, FrameVersionMismatch) {
    // A handshake in a foreign version is answered as unsupported
    auto handshake = raw_header(2, static_cast<uint8_t>(MessageType::HANDSHAKE), 0);
    expect_kind([&]() { codec.decode(handshake); }, ErrorKind::VERSION_UNSUPPORTED);

    // Any other frame in a foreign version is malformed
    auto chunk = raw_header(2, static_cast<uint8_t>(MessageType::FILE_CHUNK), 0);
    expect_kind([&]() { codec.decode(chunk); }, ErrorKind::MALFORMED_MESSAGE);
}

TEST_F(CodecTest, OversizedLengthIsMalformed) {
    auto bytes = raw_header(WIRE_VERSION, static_cast<uint8_t>(MessageType::FILE_CHUNK),
                            MAX_PAYLOAD_SIZE + 1);
    expect_kind([&]() { codec.decode(bytes); }, ErrorKind::MALFORMED_MESSAGE);

    Codec small_codec(16);
    ProtocolMessage message(MessageType::FILE_CHUNK, std::vector<uint8_t>(17, 0));
    expect_kind([&]() { small_codec.encode(message); }, ErrorKind::MALFORMED_MESSAGE);
}

TEST_F(CodecTest, ShortBufferIsTruncated) {
    auto bytes = codec.encode(ProtocolMessage(MessageType::FILE_CHUNK, {1, 2, 3, 4}));

    // Cut inside the header
    std::vector<uint8_t> header_only(bytes.begin(), bytes.begin() + 3);
    expect_kind([&]() { codec.decode(header_only); }, ErrorKind::TRUNCATED);

    // Cut inside the payload
    std::vector<uint8_t> partial(bytes.begin(), bytes.end() - 1);
    expect_kind([&]() { codec.decode(partial); }, ErrorKind::TRUNCATED);
}

TEST_F(CodecTest, TrailingBytesAreMalformed) {
    auto bytes = codec.encode(ProtocolMessage(MessageType::CHUNK_ACK, encode_chunk_ack(3)));
    bytes.push_back(0x00);
    expect_kind([&]() { codec.decode(bytes); }, ErrorKind::MALFORMED_MESSAGE);
}

TEST_F(CodecTest, TryDecodeWaitsForCompleteFrame) {
    auto first = codec.encode(ProtocolMessage(MessageType::HANDSHAKE, encode_version("1.0.0")));
    auto second = codec.encode(ProtocolMessage(MessageType::LIST_REQUEST));

    std::vector<uint8_t> buffer(first.begin(), first.end() - 2);
    EXPECT_FALSE(codec.try_decode(buffer.data(), buffer.size()).has_value());

    buffer = first;
    buffer.insert(buffer.end(), second.begin(), second.end());

    auto decoded = codec.try_decode(buffer.data(), buffer.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->message.type, MessageType::HANDSHAKE);
    EXPECT_EQ(decoded->bytes_consumed, first.size());

    auto next = codec.try_decode(buffer.data() + decoded->bytes_consumed,
                                 buffer.size() - decoded->bytes_consumed);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->message.type, MessageType::LIST_REQUEST);
}

TEST_F(CodecTest, StreamSerialization) {
    std::stringstream stream;
    ProtocolMessage first(MessageType::FILE_REQUEST, {9, 8, 7});
    ProtocolMessage second(MessageType::UPLOAD_START);

    EXPECT_EQ(codec.serialize(first, stream), HEADER_SIZE + 3);
    EXPECT_EQ(codec.serialize(second, stream), HEADER_SIZE);

    ProtocolMessage read_first = codec.deserialize(stream);
    ProtocolMessage read_second = codec.deserialize(stream);
    EXPECT_EQ(read_first.type, MessageType::FILE_REQUEST);
    EXPECT_EQ(read_first.payload, first.payload);
    EXPECT_EQ(read_second.type, MessageType::UPLOAD_START);
}

TEST_F(CodecTest, StreamEndingMidFrameIsTruncated) {
    auto bytes = codec.encode(ProtocolMessage(MessageType::FILE_CHUNK, {1, 2, 3, 4, 5}));
    std::string cut(bytes.begin(), bytes.end() - 2);
    std::istringstream stream(cut);
    expect_kind([&]() { codec.deserialize(stream); }, ErrorKind::TRUNCATED);
}

TEST_F(CodecTest, MessageTypeNames) {
    EXPECT_STREQ(message_type_to_string(MessageType::HANDSHAKE), "HANDSHAKE");
    EXPECT_STREQ(message_type_to_string(MessageType::ERROR), "ERROR");
    ASSERT_TRUE(message_type_from_byte(0x0A).has_value());
    EXPECT_EQ(*message_type_from_byte(0x0A), MessageType::LIST_RESPONSE);
    EXPECT_FALSE(message_type_from_byte(0x00).has_value());
    EXPECT_FALSE(message_type_from_byte(0x0B).has_value());
}
