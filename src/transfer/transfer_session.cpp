#include "transfer/transfer_session.hpp"
#include "transfer/chunk_packing.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace lbft {
namespace transfer {

using protocol::ErrorKind;
using protocol::ProtocolError;

void validate_metadata(const protocol::FileMetadata& metadata) {
  protocol::validate_filename(metadata.name);
  validate_chunk_size(metadata.chunk_size);
  if (metadata.chunk_count() > UINT32_MAX) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "file of " + std::to_string(metadata.total_size) +
                        " bytes needs more chunk indices than the wire carries");
  }
}

protocol::FileMetadata describe_source(const std::string& name, std::istream& source,
                                       uint32_t chunk_size, bool compression) {
  protocol::FileMetadata metadata;
  metadata.name = name;
  metadata.chunk_size = chunk_size;
  metadata.compression = compression;

  source.clear();
  source.seekg(0, std::ios::beg);
  integrity::Digest hasher;
  std::vector<uint8_t> block(64 * 1024);
  uint64_t total = 0;
  while (source) {
    source.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
    std::streamsize got = source.gcount();
    if (got > 0) {
      hasher.update(block.data(), static_cast<std::size_t>(got));
      total += static_cast<uint64_t>(got);
    }
  }
  if (source.bad()) {
    throw ProtocolError(ErrorKind::WRITE_ERROR, "failed to read source for " + name);
  }
  metadata.total_size = total;
  metadata.digest = hasher.finalize();

  // Rewind so the chunk stream starts from the first byte
  source.clear();
  source.seekg(0, std::ios::beg);
  if (!source) {
    throw ProtocolError(ErrorKind::WRITE_ERROR, "failed to rewind source for " + name);
  }

  BOOST_LOG_TRIVIAL(debug) << "Transfer: Described " << name << ", " << total << " bytes, digest "
                           << integrity::to_hex(metadata.digest);
  return metadata;
}


//==============================================
// CONSTRUCTION
//==============================================

TransferSession::TransferSession(const protocol::FileMetadata& metadata)
  : metadata_(metadata) {}

std::unique_ptr<TransferSession> TransferSession::for_sending(
    const protocol::FileMetadata& metadata,
    std::unique_ptr<std::istream> source,
    integrity::CompressionLevel level) {
  validate_metadata(metadata);

  std::unique_ptr<TransferSession> session(new TransferSession(metadata));
  session->source_ = std::move(source);
  session->reader_ = std::make_unique<ChunkReader>(*session->source_, metadata.total_size,
                                                   metadata.chunk_size);
  session->level_ = level;
  return session;
}

std::unique_ptr<TransferSession> TransferSession::for_receiving(
    const protocol::FileMetadata& metadata,
    store::TempFile temp) {
  validate_metadata(metadata);

  std::unique_ptr<TransferSession> session(new TransferSession(metadata));
  session->temp_ = std::make_unique<store::TempFile>(std::move(temp));
  return session;
}


//==============================================
// SENDER OPERATIONS
//==============================================

std::optional<protocol::ProtocolMessage> TransferSession::next_chunk_message() {
  if (!reader_) {
    throw std::logic_error("Transfer: next_chunk_message on a receiving session");
  }

  auto chunk = reader_->next();
  if (!chunk) {
    return std::nullopt;
  }

  auto payload = pack_chunk(*chunk, metadata_.compression, level_);
  ++chunks_transferred_;
  bytes_transferred_ += chunk->data.size();

  BOOST_LOG_TRIVIAL(trace) << "Transfer: Chunk " << payload.index << " of " << metadata_.name
                           << ", " << payload.raw_length << " raw / " << payload.data.size()
                           << " on the wire";
  return protocol::ProtocolMessage(protocol::MessageType::FILE_CHUNK,
                                   protocol::encode_chunk(payload));
}


//==============================================
// RECEIVER OPERATIONS
//==============================================

void TransferSession::receive_chunk(const protocol::ChunkPayload& payload) {
  if (!temp_) {
    throw std::logic_error("Transfer: receive_chunk on a sending session");
  }
  if (all_chunks_transferred()) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "chunk " + std::to_string(payload.index) + " beyond the declared " +
                        std::to_string(expected_chunks()) + " chunks");
  }
  if (payload.index != chunks_transferred_) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "expected chunk " + std::to_string(chunks_transferred_) + ", got " +
                        std::to_string(payload.index));
  }

  Chunk chunk = unpack_chunk(payload, metadata_.chunk_size);

  // Every chunk but the last is full, the last carries the remainder
  uint64_t expected_size = std::min<uint64_t>(metadata_.chunk_size,
                                              metadata_.total_size - bytes_transferred_);
  if (chunk.data.size() != expected_size) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "chunk " + std::to_string(payload.index) + " carries " +
                        std::to_string(chunk.data.size()) + " bytes, expected " +
                        std::to_string(expected_size));
  }

  try {
    temp_->write(chunk.data);
  } catch (const store::StoreError& e) {
    throw ProtocolError(ErrorKind::WRITE_ERROR, e.what());
  }
  digest_.update(chunk.data);

  ++chunks_transferred_;
  bytes_transferred_ += chunk.data.size();
}

bool TransferSession::verify() {
  if (!temp_) {
    throw std::logic_error("Transfer: verify on a sending session");
  }
  if (bytes_transferred_ != metadata_.total_size) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "received " + std::to_string(bytes_transferred_) + " of the declared " +
                        std::to_string(metadata_.total_size) + " bytes of " + metadata_.name);
  }
  if (!computed_digest_) {
    computed_digest_ = digest_.finalize();
  }

  bool matches = *computed_digest_ == metadata_.digest;
  if (matches) {
    BOOST_LOG_TRIVIAL(info) << "Transfer: Digest verified for " << metadata_.name << " ("
                            << bytes_transferred_ << " bytes)";
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Transfer: Digest mismatch for " << metadata_.name
                               << ", expected " << integrity::to_hex(metadata_.digest)
                               << ", computed " << integrity::to_hex(*computed_digest_);
  }
  return matches;
}

store::TempFile& TransferSession::temp_file() {
  if (!temp_) {
    throw std::logic_error("Transfer: no temporary file on a sending session");
  }
  return *temp_;
}

} // namespace transfer
} // namespace lbft
