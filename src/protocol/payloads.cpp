#include "protocol/payloads.hpp"
#include "protocol/byte_buffer.hpp"
#include <algorithm>

namespace lbft {
namespace protocol {

//==============================================
// FILENAME VALIDATION
//==============================================

bool is_valid_filename(const std::string& name) {
  if (name.empty() || name.size() > MAX_FILENAME_LENGTH) {
    return false;
  }
  // Covers ".", ".." and the hidden names reserved for partial uploads
  if (name.front() == '.') {
    return false;
  }
  return std::none_of(name.begin(), name.end(), [](char c) {
    return c == '/' || c == '\\' || c == '\0';
  });
}

void validate_filename(const std::string& name) {
  if (!is_valid_filename(name)) {
    throw ProtocolError(ErrorKind::INVALID_FILENAME, "rejected filename '" + name + "'");
  }
}


//==============================================
// PAYLOAD ENCODING
//==============================================

std::vector<uint8_t> encode_version(const std::string& version) {
  return std::vector<uint8_t>(version.begin(), version.end());
}

std::vector<uint8_t> encode_file_request(const FileRequest& request) {
  std::vector<uint8_t> out;
  ByteWriter writer(out);
  writer.write_string(request.name);
  writer.write_u32(request.chunk_size);
  writer.write_u8(request.compression ? 1 : 0);
  return out;
}

std::vector<uint8_t> encode_file_metadata(const FileMetadata& metadata) {
  std::vector<uint8_t> out;
  ByteWriter writer(out);
  writer.write_string(metadata.name);
  writer.write_u64(metadata.total_size);
  writer.write_u32(metadata.chunk_size);
  writer.write_u8(metadata.compression ? 1 : 0);
  writer.write_bytes(metadata.digest.data(), metadata.digest.size());
  return out;
}

std::vector<uint8_t> encode_chunk(const ChunkPayload& chunk) {
  std::vector<uint8_t> out;
  out.reserve(9 + chunk.data.size());
  ByteWriter writer(out);
  writer.write_u32(chunk.index);
  writer.write_u8(chunk.compressed ? 1 : 0);
  writer.write_u32(chunk.raw_length);
  writer.write_bytes(chunk.data);
  return out;
}

std::vector<uint8_t> encode_chunk_ack(uint32_t next_expected) {
  std::vector<uint8_t> out;
  ByteWriter writer(out);
  writer.write_u32(next_expected);
  return out;
}

std::vector<uint8_t> encode_upload_complete(const integrity::DigestValue& digest) {
  return std::vector<uint8_t>(digest.begin(), digest.end());
}

std::vector<uint8_t> encode_list_response(const std::vector<ListEntry>& entries) {
  std::vector<uint8_t> out;
  ByteWriter writer(out);
  writer.write_u32(static_cast<uint32_t>(entries.size()));
  for (const auto& entry : entries) {
    writer.write_string(entry.name);
    writer.write_u64(entry.size);
    writer.write_i64(entry.modified_time);
  }
  return out;
}

std::vector<uint8_t> encode_error(const ErrorPayload& error) {
  std::vector<uint8_t> out;
  ByteWriter writer(out);
  writer.write_u8(static_cast<uint8_t>(error.kind));
  writer.write_string(error.message);
  return out;
}


//==============================================
// PAYLOAD DECODING
//==============================================

std::string decode_version(const std::vector<uint8_t>& payload) {
  if (payload.empty()) {
    throw ProtocolError(ErrorKind::MALFORMED_MESSAGE, "empty version string");
  }
  return std::string(payload.begin(), payload.end());
}

FileRequest decode_file_request(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  FileRequest request;
  request.name = reader.read_string();
  request.chunk_size = reader.read_u32();
  request.compression = reader.read_u8() != 0;
  reader.expect_end();
  return request;
}

FileMetadata decode_file_metadata(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  FileMetadata metadata;
  metadata.name = reader.read_string();
  metadata.total_size = reader.read_u64();
  metadata.chunk_size = reader.read_u32();
  metadata.compression = reader.read_u8() != 0;
  auto digest = reader.read_bytes(integrity::DIGEST_SIZE);
  std::copy(digest.begin(), digest.end(), metadata.digest.begin());
  reader.expect_end();
  return metadata;
}

ChunkPayload decode_chunk(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  ChunkPayload chunk;
  chunk.index = reader.read_u32();
  chunk.compressed = reader.read_u8() != 0;
  chunk.raw_length = reader.read_u32();
  chunk.data = reader.read_remaining();
  return chunk;
}

uint32_t decode_chunk_ack(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  uint32_t next_expected = reader.read_u32();
  reader.expect_end();
  return next_expected;
}

integrity::DigestValue decode_upload_complete(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  auto bytes = reader.read_bytes(integrity::DIGEST_SIZE);
  reader.expect_end();
  integrity::DigestValue digest{};
  std::copy(bytes.begin(), bytes.end(), digest.begin());
  return digest;
}

std::vector<ListEntry> decode_list_response(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  uint32_t count = reader.read_u32();
  std::vector<ListEntry> entries;
  // Each entry needs at least 20 bytes, so the count cannot force a huge reserve
  entries.reserve(std::min<std::size_t>(count, reader.remaining() / 20));
  for (uint32_t i = 0; i < count; ++i) {
    ListEntry entry;
    entry.name = reader.read_string();
    entry.size = reader.read_u64();
    entry.modified_time = reader.read_i64();
    entries.push_back(std::move(entry));
  }
  reader.expect_end();
  return entries;
}

ErrorPayload decode_error(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  uint8_t code = reader.read_u8();
  auto kind = error_kind_from_code(code);
  if (!kind) {
    throw ProtocolError(ErrorKind::MALFORMED_MESSAGE, "unknown error code " + std::to_string(code));
  }
  ErrorPayload error;
  error.kind = *kind;
  error.message = reader.read_string();
  reader.expect_end();
  return error;
}


//==============================================
// MESSAGE BUILDERS
//==============================================

ProtocolMessage make_error_message(ErrorKind kind, const std::string& message) {
  return ProtocolMessage(MessageType::ERROR, encode_error(ErrorPayload{kind, message}));
}

} // namespace protocol
} // namespace lbft
