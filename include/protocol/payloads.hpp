#ifndef LBFT_PROTOCOL_PAYLOADS_HPP
#define LBFT_PROTOCOL_PAYLOADS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "integrity/digest.hpp"
#include "protocol/message.hpp"
#include "protocol/protocol_error.hpp"

namespace lbft {
namespace protocol {

constexpr std::size_t MAX_FILENAME_LENGTH = 255;

// Describes a file before transfer, immutable once sent
struct FileMetadata {
  std::string name;
  uint64_t total_size = 0;
  uint32_t chunk_size = 0;
  bool compression = false;
  integrity::DigestValue digest{};

  // Number of FILE_CHUNK messages the transfer carries
  uint64_t chunk_count() const {
    if (chunk_size == 0) {
      return 0;
    }
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
  }
};

// Body of a FILE_REQUEST, the client proposes chunk size and compression
struct FileRequest {
  std::string name;
  uint32_t chunk_size = 0;
  bool compression = false;
};

// Body of a FILE_CHUNK as it travels on the wire
struct ChunkPayload {
  uint32_t index = 0;
  bool compressed = false;
  uint32_t raw_length = 0;
  std::vector<uint8_t> data;
};

struct ErrorPayload {
  ErrorKind kind = ErrorKind::PROTOCOL_VIOLATION;
  std::string message;
};

struct ListEntry {
  std::string name;
  uint64_t size = 0;
  int64_t modified_time = 0;  // seconds since the unix epoch

  bool operator==(const ListEntry& other) const {
    return name == other.name && size == other.size && modified_time == other.modified_time;
  }
};


// ---- FILENAME VALIDATION ----
// Throws INVALID_FILENAME for empty, oversized, hidden or path-like names
void validate_filename(const std::string& name);
bool is_valid_filename(const std::string& name);


// ---- PAYLOAD ENCODING ----
std::vector<uint8_t> encode_version(const std::string& version);
std::vector<uint8_t> encode_file_request(const FileRequest& request);
std::vector<uint8_t> encode_file_metadata(const FileMetadata& metadata);
std::vector<uint8_t> encode_chunk(const ChunkPayload& chunk);
std::vector<uint8_t> encode_chunk_ack(uint32_t next_expected);
std::vector<uint8_t> encode_upload_complete(const integrity::DigestValue& digest);
std::vector<uint8_t> encode_list_response(const std::vector<ListEntry>& entries);
std::vector<uint8_t> encode_error(const ErrorPayload& error);


// ---- PAYLOAD DECODING ----
// All decoders throw MALFORMED_MESSAGE on short or oversized payloads
std::string decode_version(const std::vector<uint8_t>& payload);
FileRequest decode_file_request(const std::vector<uint8_t>& payload);
FileMetadata decode_file_metadata(const std::vector<uint8_t>& payload);
ChunkPayload decode_chunk(const std::vector<uint8_t>& payload);
uint32_t decode_chunk_ack(const std::vector<uint8_t>& payload);
integrity::DigestValue decode_upload_complete(const std::vector<uint8_t>& payload);
std::vector<ListEntry> decode_list_response(const std::vector<uint8_t>& payload);
ErrorPayload decode_error(const std::vector<uint8_t>& payload);


// ---- MESSAGE BUILDERS ----
ProtocolMessage make_error_message(ErrorKind kind, const std::string& message);

} // namespace protocol
} // namespace lbft

#endif // LBFT_PROTOCOL_PAYLOADS_HPP
