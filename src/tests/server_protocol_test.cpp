#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include "transfer/server_protocol.hpp"
#include "transfer/chunk_packing.hpp"
#include "protocol/payloads.hpp"
#include "test_utils.hpp"

using namespace lbft::transfer;
using namespace lbft::protocol;
using State = TransferState::State;

class ServerProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = lbft::test::make_temp_dir("lbft_server_protocol_test");
        store_ = std::make_unique<lbft::store::Store>(dir_.string());
        protocol_ = std::make_unique<ServerProtocol>(*store_, config_, sink_);
    }

    void TearDown() override {
        protocol_.reset();
        store_.reset();
        std::filesystem::remove_all(dir_);
    }

    void handshake() {
        protocol_->handle(ProtocolMessage(MessageType::HANDSHAKE, encode_version("1.0.0")));
        ASSERT_EQ(protocol_->state(), State::READY);
        sink_.messages.clear();
    }

    void request(const std::string& name, uint32_t chunk_size, bool compression = false) {
        protocol_->handle(ProtocolMessage(MessageType::FILE_REQUEST,
                                          encode_file_request(FileRequest{name, chunk_size, compression})));
    }

    // Reassembles the chunks the server sent for a download
    std::vector<uint8_t> received_bytes(const FileMetadata& metadata) const {
        std::vector<uint8_t> bytes;
        for (const auto& message : sink_.messages) {
            if (message.type == MessageType::FILE_CHUNK) {
                auto chunk = unpack_chunk(decode_chunk(message.payload), metadata.chunk_size);
                bytes.insert(bytes.end(), chunk.data.begin(), chunk.data.end());
            }
        }
        return bytes;
    }

    // Metadata plus chunk messages a client would send for an upload
    static std::vector<ProtocolMessage> upload_messages(const std::string& name,
                                                        const std::vector<uint8_t>& bytes,
                                                        uint32_t chunk_size) {
        auto source = std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end()));
        FileMetadata metadata = describe_source(name, *source, chunk_size, true);
        auto sender = TransferSession::for_sending(metadata, std::move(source),
                                                   lbft::integrity::CompressionLevel::MEDIUM);

        std::vector<ProtocolMessage> messages;
        messages.emplace_back(MessageType::FILE_METADATA, encode_file_metadata(metadata));
        while (auto message = sender->next_chunk_message()) {
            messages.push_back(*message);
        }
        return messages;
    }

    ErrorPayload last_error() const {
        for (auto it = sink_.messages.rbegin(); it != sink_.messages.rend(); ++it) {
            if (it->type == MessageType::ERROR) {
                return decode_error(it->payload);
            }
        }
        ADD_FAILURE() << "No ERROR message was sent";
        return ErrorPayload{};
    }

    std::size_t partial_files() const {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir_ / lbft::store::Store::PARTIAL_DIR)) {
            (void)entry;
            ++count;
        }
        return count;
    }

    std::filesystem::path dir_;
    lbft::config::ProtocolConfig config_;
    lbft::test::RecordingSink sink_;
    std::unique_ptr<lbft::store::Store> store_;
    std::unique_ptr<ServerProtocol> protocol_;
};

TEST_F(ServerProtocolTest, HandshakeAccepted) {
    protocol_->handle(ProtocolMessage(MessageType::HANDSHAKE, encode_version("1.0.0")));

    ASSERT_EQ(sink_.messages.size(), 1u);
    EXPECT_EQ(sink_.messages[0].type, MessageType::HANDSHAKE_ACK);
    EXPECT_EQ(decode_version(sink_.messages[0].payload), "1.0.0");
    EXPECT_EQ(protocol_->state(), State::READY);
    EXPECT_FALSE(protocol_->should_close());
}

TEST_F(ServerProtocolTest, MinorVersionDifferenceAccepted) {
    protocol_->handle(ProtocolMessage(MessageType::HANDSHAKE, encode_version("1.4.2")));
    EXPECT_EQ(protocol_->state(), State::READY);
}

TEST_F(ServerProtocolTest, UnsupportedVersionRejected) {
    protocol_->handle(ProtocolMessage(MessageType::HANDSHAKE, encode_version("2.0.0")));

    EXPECT_EQ(last_error().kind, ErrorKind::VERSION_UNSUPPORTED);
    EXPECT_EQ(protocol_->state(), State::IDLE);
    EXPECT_TRUE(protocol_->should_close());

    // Nothing is processed once the connection is marked for close
    protocol_->handle(ProtocolMessage(MessageType::HANDSHAKE, encode_version("1.0.0")));
    EXPECT_EQ(protocol_->state(), State::IDLE);
    EXPECT_EQ(sink_.messages.size(), 1u);
}

TEST_F(ServerProtocolTest, RequestBeforeHandshakeIsViolation) {
    request("a.bin", 1024);
    EXPECT_EQ(last_error().kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(protocol_->state(), State::FAILED);
    EXPECT_TRUE(protocol_->should_close());
}

TEST_F(ServerProtocolTest, ListReportsCommittedFiles) {
    lbft::test::write_file(dir_ / "b.bin", {1, 2, 3});
    lbft::test::write_file(dir_ / "a.bin", {});
    handshake();

    protocol_->handle(ProtocolMessage(MessageType::LIST_REQUEST));

    ASSERT_EQ(sink_.messages.size(), 1u);
    ASSERT_EQ(sink_.messages[0].type, MessageType::LIST_RESPONSE);
    auto entries = decode_list_response(sink_.messages[0].payload);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "a.bin");
    EXPECT_EQ(entries[0].size, 0u);
    EXPECT_EQ(entries[1].name, "b.bin");
    EXPECT_EQ(entries[1].size, 3u);
    EXPECT_EQ(protocol_->state(), State::READY);
}

TEST_F(ServerProtocolTest, DownloadStreamsEveryChunk) {
    auto bytes = lbft::test::random_bytes(10000);
    lbft::test::write_file(dir_ / "data.bin", bytes);
    handshake();

    request("data.bin", 4096);

    ASSERT_EQ(sink_.messages.size(), 4u);
    ASSERT_EQ(sink_.messages[0].type, MessageType::FILE_METADATA);
    FileMetadata metadata = decode_file_metadata(sink_.messages[0].payload);
    EXPECT_EQ(metadata.name, "data.bin");
    EXPECT_EQ(metadata.total_size, bytes.size());
    EXPECT_EQ(metadata.chunk_size, 4096u);
    EXPECT_FALSE(metadata.compression);
    EXPECT_EQ(metadata.digest, lbft::integrity::digest(bytes));
    EXPECT_EQ(received_bytes(metadata), bytes);
    EXPECT_EQ(protocol_->state(), State::VERIFYING);

    protocol_->handle(ProtocolMessage(MessageType::CHUNK_ACK, encode_chunk_ack(3)));
    EXPECT_EQ(protocol_->state(), State::READY);
    EXPECT_EQ(protocol_->session(), nullptr);
    EXPECT_FALSE(protocol_->should_close());
}

TEST_F(ServerProtocolTest, DownloadWithCompression) {
    auto bytes = lbft::test::text_bytes(20000);
    lbft::test::write_file(dir_ / "text.txt", bytes);
    handshake();

    request("text.txt", 16384, true);

    FileMetadata metadata = decode_file_metadata(sink_.messages[0].payload);
    EXPECT_TRUE(metadata.compression);
    ASSERT_EQ(sink_.messages.size(), 3u);
    EXPECT_TRUE(decode_chunk(sink_.messages[1].payload).compressed);
    EXPECT_EQ(received_bytes(metadata), bytes);
}

TEST_F(ServerProtocolTest, CompressionDisabledByConfig) {
    config_.compression_enabled = false;
    lbft::test::write_file(dir_ / "text.txt", lbft::test::text_bytes(5000));
    handshake();

    request("text.txt", 4096, true);

    FileMetadata metadata = decode_file_metadata(sink_.messages[0].payload);
    EXPECT_FALSE(metadata.compression);
    EXPECT_FALSE(decode_chunk(sink_.messages[1].payload).compressed);
}

TEST_F(ServerProtocolTest, DownloadOfEmptyAndExactMultipleFiles) {
    lbft::test::write_file(dir_ / "empty.bin", {});
    lbft::test::write_file(dir_ / "exact.bin", lbft::test::random_bytes(2048));
    handshake();

    request("empty.bin", 1024);
    ASSERT_EQ(sink_.types(), std::vector<MessageType>{MessageType::FILE_METADATA});
    EXPECT_EQ(decode_file_metadata(sink_.messages[0].payload).total_size, 0u);
    protocol_->handle(ProtocolMessage(MessageType::CHUNK_ACK, encode_chunk_ack(0)));
    EXPECT_EQ(protocol_->state(), State::READY);

    sink_.messages.clear();
    request("exact.bin", 1024);
    EXPECT_EQ(sink_.types(), (std::vector<MessageType>{MessageType::FILE_METADATA,
                                                       MessageType::FILE_CHUNK,
                                                       MessageType::FILE_CHUNK}));
}

TEST_F(ServerProtocolTest, RejectedRequestsKeepConnection) {
    handshake();

    request("missing.bin", 4096);
    EXPECT_EQ(last_error().kind, ErrorKind::FILE_NOT_FOUND);
    EXPECT_EQ(protocol_->state(), State::READY);

    request("../secret", 4096);
    EXPECT_EQ(last_error().kind, ErrorKind::INVALID_FILENAME);
    EXPECT_EQ(protocol_->state(), State::READY);

    lbft::test::write_file(dir_ / "data.bin", {1, 2, 3});
    request("data.bin", 1000);
    EXPECT_EQ(last_error().kind, ErrorKind::INVALID_CHUNK_SIZE);
    EXPECT_EQ(protocol_->state(), State::READY);
    EXPECT_FALSE(protocol_->should_close());

    // The connection still serves requests afterwards
    sink_.messages.clear();
    request("data.bin", 1024);
    EXPECT_EQ(sink_.messages[0].type, MessageType::FILE_METADATA);
}

TEST_F(ServerProtocolTest, ClientReportedChecksumMismatchFailsSession) {
    lbft::test::write_file(dir_ / "data.bin", lbft::test::random_bytes(3000));
    handshake();
    request("data.bin", 1024);
    sink_.messages.clear();

    protocol_->handle(make_error_message(ErrorKind::CHECKSUM_MISMATCH, "digest differs"));

    EXPECT_EQ(protocol_->state(), State::FAILED);
    EXPECT_TRUE(protocol_->should_close());
    // No ERROR is echoed back to the client
    EXPECT_TRUE(sink_.messages.empty());
}

TEST_F(ServerProtocolTest, WrongAcknowledgementIsViolation) {
    lbft::test::write_file(dir_ / "data.bin", lbft::test::random_bytes(3000));
    handshake();
    request("data.bin", 1024);

    protocol_->handle(ProtocolMessage(MessageType::CHUNK_ACK, encode_chunk_ack(2)));
    EXPECT_EQ(last_error().kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(protocol_->state(), State::FAILED);
}

TEST_F(ServerProtocolTest, UploadCommitsVerifiedFile) {
    auto bytes = lbft::test::text_bytes(9000);
    handshake();

    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));
    EXPECT_EQ(protocol_->state(), State::UPLOADING);
    EXPECT_TRUE(sink_.messages.empty());

    for (const auto& message : upload_messages("upload.txt", bytes, 4096)) {
        protocol_->handle(message);
    }

    ASSERT_EQ(sink_.types(), std::vector<MessageType>{MessageType::UPLOAD_COMPLETE});
    EXPECT_EQ(decode_upload_complete(sink_.messages[0].payload), lbft::integrity::digest(bytes));
    EXPECT_EQ(protocol_->state(), State::READY);
    EXPECT_EQ(lbft::test::read_file(dir_ / "upload.txt"), bytes);
    EXPECT_EQ(partial_files(), 0u);
}

TEST_F(ServerProtocolTest, UploadOfEmptyFileCompletesOnMetadata) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));

    auto messages = upload_messages("empty.bin", {}, 1024);
    ASSERT_EQ(messages.size(), 1u);
    protocol_->handle(messages[0]);

    ASSERT_EQ(sink_.types(), std::vector<MessageType>{MessageType::UPLOAD_COMPLETE});
    EXPECT_TRUE(std::filesystem::exists(dir_ / "empty.bin"));
    EXPECT_EQ(std::filesystem::file_size(dir_ / "empty.bin"), 0u);
}

TEST_F(ServerProtocolTest, UploadWithWrongDigestIsDiscarded) {
    auto bytes = lbft::test::random_bytes(5000);
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));

    auto messages = upload_messages("bad.bin", bytes, 1024);
    FileMetadata metadata = decode_file_metadata(messages[0].payload);
    metadata.digest[31] ^= 0x01;
    messages[0] = ProtocolMessage(MessageType::FILE_METADATA, encode_file_metadata(metadata));

    for (const auto& message : messages) {
        protocol_->handle(message);
    }

    EXPECT_EQ(last_error().kind, ErrorKind::CHECKSUM_MISMATCH);
    EXPECT_EQ(protocol_->state(), State::FAILED);
    EXPECT_TRUE(protocol_->should_close());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "bad.bin"));
    EXPECT_EQ(partial_files(), 0u);
}

TEST_F(ServerProtocolTest, UploadWithSkippedChunkIsViolation) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));

    auto messages = upload_messages("gap.bin", lbft::test::random_bytes(4000), 1024);
    protocol_->handle(messages[0]);
    protocol_->handle(messages[1]);
    protocol_->handle(messages[3]);

    EXPECT_EQ(last_error().kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(protocol_->state(), State::FAILED);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "gap.bin"));
    EXPECT_EQ(partial_files(), 0u);
}

TEST_F(ServerProtocolTest, UploadWithInvalidMetadataFails) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));

    auto messages = upload_messages("fine.bin", {1, 2, 3}, 1024);
    FileMetadata metadata = decode_file_metadata(messages[0].payload);
    metadata.name = "sub/dir.bin";
    protocol_->handle(ProtocolMessage(MessageType::FILE_METADATA, encode_file_metadata(metadata)));

    EXPECT_EQ(last_error().kind, ErrorKind::INVALID_FILENAME);
    EXPECT_EQ(protocol_->state(), State::FAILED);
}

TEST_F(ServerProtocolTest, UploadDeclaringHugeSizeIsRejected) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));

    // Size near the top of uint64_t with the digest of no bytes at all
    FileMetadata metadata;
    metadata.name = "huge.bin";
    metadata.total_size = UINT64_MAX;
    metadata.chunk_size = 1024;
    metadata.digest = lbft::integrity::digest(std::vector<uint8_t>{});
    protocol_->handle(ProtocolMessage(MessageType::FILE_METADATA, encode_file_metadata(metadata)));

    EXPECT_EQ(last_error().kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(protocol_->state(), State::FAILED);
    auto types = sink_.types();
    EXPECT_EQ(std::count(types.begin(), types.end(), MessageType::UPLOAD_COMPLETE), 0);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "huge.bin"));
    EXPECT_EQ(partial_files(), 0u);
}

TEST_F(ServerProtocolTest, ChunkBeforeMetadataIsViolation) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));

    auto messages = upload_messages("early.bin", lbft::test::random_bytes(100), 1024);
    protocol_->handle(messages[1]);

    EXPECT_EQ(last_error().kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(protocol_->state(), State::FAILED);
}

TEST_F(ServerProtocolTest, UnexpectedMessageInReady) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::FILE_CHUNK, encode_chunk(ChunkPayload{})));

    EXPECT_EQ(last_error().kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(protocol_->state(), State::FAILED);
}

TEST_F(ServerProtocolTest, MalformedPayloadFailsSession) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::FILE_REQUEST, {0x00, 0x01}));

    EXPECT_EQ(last_error().kind, ErrorKind::MALFORMED_MESSAGE);
    EXPECT_EQ(protocol_->state(), State::FAILED);
}

TEST_F(ServerProtocolTest, ConnectionFailureWithoutNotification) {
    handshake();
    protocol_->handle(ProtocolMessage(MessageType::UPLOAD_START));
    auto messages = upload_messages("cut.bin", lbft::test::random_bytes(3000), 1024);
    protocol_->handle(messages[0]);
    protocol_->handle(messages[1]);
    EXPECT_EQ(partial_files(), 1u);

    protocol_->fail(ErrorKind::TRUNCATED, "peer closed mid-transfer", false);

    EXPECT_TRUE(sink_.messages.empty());
    EXPECT_EQ(protocol_->state(), State::FAILED);
    EXPECT_EQ(partial_files(), 0u);
}

class MockMessageSink : public MessageSink {
public:
    MOCK_METHOD(void, send, (const ProtocolMessage& message), (override));
};

TEST(ServerProtocolSinkTest, BrokenSinkFailsDownload) {
    using ::testing::_;
    using ::testing::Field;
    using ::testing::Return;
    using ::testing::Throw;

    auto dir = lbft::test::make_temp_dir("lbft_sink_test");
    lbft::test::write_file(dir / "data.bin", lbft::test::random_bytes(4096));
    lbft::store::Store store(dir.string());
    lbft::config::ProtocolConfig config;
    ::testing::StrictMock<MockMessageSink> sink;
    ServerProtocol protocol(store, config, sink);

    {
        ::testing::InSequence sequence;
        EXPECT_CALL(sink, send(Field(&ProtocolMessage::type, MessageType::HANDSHAKE_ACK)));
        EXPECT_CALL(sink, send(Field(&ProtocolMessage::type, MessageType::FILE_METADATA)));
        EXPECT_CALL(sink, send(Field(&ProtocolMessage::type, MessageType::FILE_CHUNK)))
          .WillOnce(Throw(ProtocolError(ErrorKind::WRITE_ERROR, "broken pipe")));
        // The failure report is attempted and its own failure swallowed
        EXPECT_CALL(sink, send(Field(&ProtocolMessage::type, MessageType::ERROR)))
          .WillOnce(Throw(ProtocolError(ErrorKind::WRITE_ERROR, "broken pipe")));
    }

    protocol.handle(ProtocolMessage(MessageType::HANDSHAKE, encode_version("1.0.0")));
    protocol.handle(ProtocolMessage(MessageType::FILE_REQUEST,
                                    encode_file_request(FileRequest{"data.bin", 1024, false})));

    EXPECT_EQ(protocol.state(), State::FAILED);
    EXPECT_TRUE(protocol.should_close());
    EXPECT_EQ(protocol.session(), nullptr);

    std::filesystem::remove_all(dir);
}
