#ifndef LBFT_TRANSFER_SESSION_HPP
#define LBFT_TRANSFER_SESSION_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include "integrity/compression.hpp"
#include "integrity/digest.hpp"
#include "protocol/message.hpp"
#include "protocol/payloads.hpp"
#include "store/store.hpp"
#include "transfer/chunker.hpp"

namespace lbft {
namespace transfer {

// Checks name and chunk size of received metadata
void validate_metadata(const protocol::FileMetadata& metadata);

// Reads a source stream once to size and hash it, then rewinds it for sending
protocol::FileMetadata describe_source(const std::string& name, std::istream& source,
                                       uint32_t chunk_size, bool compression);

/**
 * Bookkeeping for one file transfer on one connection: the metadata, the running
 * chunk and byte counts and, on the receiving side, the accumulating digest and the
 * private temporary file. Dropping the session discards an uncommitted temporary file.
 */
class TransferSession {
public:
  // ---- CONSTRUCTION ----
  static std::unique_ptr<TransferSession> for_sending(const protocol::FileMetadata& metadata,
                                                      std::unique_ptr<std::istream> source,
                                                      integrity::CompressionLevel level);
  static std::unique_ptr<TransferSession> for_receiving(const protocol::FileMetadata& metadata,
                                                        store::TempFile temp);

  TransferSession(const TransferSession&) = delete;
  TransferSession& operator=(const TransferSession&) = delete;


  // ---- SENDER OPERATIONS ----
  // Next FILE_CHUNK message, nullopt once every chunk was produced
  std::optional<protocol::ProtocolMessage> next_chunk_message();


  // ---- RECEIVER OPERATIONS ----
  // Validates ordering and size, writes the raw bytes and feeds the digest
  void receive_chunk(const protocol::ChunkPayload& payload);
  // Compares the accumulated digest with the declared one, callable once.
  // Throws PROTOCOL_VIOLATION when fewer bytes arrived than the metadata declares
  bool verify();
  store::TempFile& temp_file();


  // ---- GETTERS ----
  const protocol::FileMetadata& metadata() const { return metadata_; }
  uint64_t expected_chunks() const { return metadata_.chunk_count(); }
  uint64_t chunks_transferred() const { return chunks_transferred_; }
  uint64_t bytes_transferred() const { return bytes_transferred_; }
  bool all_chunks_transferred() const { return chunks_transferred_ == expected_chunks(); }
  std::optional<integrity::DigestValue> computed_digest() const { return computed_digest_; }

private:
  TransferSession(const protocol::FileMetadata& metadata);

  // ---- PARAMETERS ----
  protocol::FileMetadata metadata_;
  uint64_t chunks_transferred_ = 0;
  uint64_t bytes_transferred_ = 0;

  // Sending side
  std::unique_ptr<std::istream> source_;
  std::unique_ptr<ChunkReader> reader_;
  integrity::CompressionLevel level_ = integrity::CompressionLevel::MEDIUM;

  // Receiving side
  std::unique_ptr<store::TempFile> temp_;
  integrity::Digest digest_;
  std::optional<integrity::DigestValue> computed_digest_;
};

} // namespace transfer
} // namespace lbft

#endif // LBFT_TRANSFER_SESSION_HPP
