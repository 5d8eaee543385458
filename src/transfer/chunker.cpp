#include "transfer/chunker.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <set>
#include <string>

namespace lbft {
namespace transfer {

using protocol::ErrorKind;
using protocol::ProtocolError;

bool is_allowed_chunk_size(uint64_t chunk_size) {
  return std::find(ALLOWED_CHUNK_SIZES.begin(), ALLOWED_CHUNK_SIZES.end(), chunk_size) !=
         ALLOWED_CHUNK_SIZES.end();
}

void validate_chunk_size(uint64_t chunk_size) {
  if (!is_allowed_chunk_size(chunk_size)) {
    throw ProtocolError(ErrorKind::INVALID_CHUNK_SIZE,
                        "chunk size " + std::to_string(chunk_size) + " is not an allowed size");
  }
}

//==============================================
// SPLIT AND JOIN
//==============================================

uint64_t Chunker::chunk_count(uint64_t total_size, uint32_t chunk_size) {
  validate_chunk_size(chunk_size);
  return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

std::vector<Chunk> Chunker::split(const std::vector<uint8_t>& file_bytes, uint32_t chunk_size) {
  validate_chunk_size(chunk_size);

  std::vector<Chunk> chunks;
  chunks.reserve(chunk_count(file_bytes.size(), chunk_size));

  for (std::size_t offset = 0; offset < file_bytes.size(); offset += chunk_size) {
    std::size_t end = std::min<std::size_t>(offset + chunk_size, file_bytes.size());
    Chunk chunk;
    chunk.index = static_cast<uint32_t>(chunks.size());
    chunk.data.assign(file_bytes.begin() + offset, file_bytes.begin() + end);
    chunks.push_back(std::move(chunk));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << file_bytes.size() << " bytes into "
                           << chunks.size() << " chunks of " << chunk_size;
  return chunks;
}

std::vector<uint8_t> Chunker::join(const std::vector<Chunk>& chunks) {
  // A gap is reported before ordering problems
  std::set<uint32_t> present;
  uint32_t max_index = 0;
  for (const auto& chunk : chunks) {
    present.insert(chunk.index);
    max_index = std::max(max_index, chunk.index);
  }
  if (!chunks.empty() && present.size() != static_cast<std::size_t>(max_index) + 1) {
    for (uint32_t i = 0; i <= max_index; ++i) {
      if (present.count(i) == 0) {
        throw ProtocolError(ErrorKind::MISSING_CHUNK, "chunk " + std::to_string(i) + " is missing");
      }
    }
  }

  std::vector<uint8_t> file_bytes;
  for (std::size_t position = 0; position < chunks.size(); ++position) {
    if (chunks[position].index != position) {
      throw ProtocolError(ErrorKind::OUT_OF_ORDER,
                          "chunk " + std::to_string(chunks[position].index) +
                          " presented at position " + std::to_string(position));
    }
    file_bytes.insert(file_bytes.end(), chunks[position].data.begin(), chunks[position].data.end());
  }
  return file_bytes;
}


//==============================================
// STREAMING READER
//==============================================

ChunkReader::ChunkReader(std::istream& input, uint64_t total_size, uint32_t chunk_size)
  : input_(input)
  , remaining_(total_size)
  , chunk_size_(chunk_size) {
  validate_chunk_size(chunk_size);
}

std::optional<Chunk> ChunkReader::next() {
  if (remaining_ == 0) {
    return std::nullopt;
  }

  std::size_t wanted = static_cast<std::size_t>(std::min<uint64_t>(remaining_, chunk_size_));
  Chunk chunk;
  chunk.index = next_index_;
  chunk.data.resize(wanted);

  if (!input_.read(reinterpret_cast<char*>(chunk.data.data()), wanted)) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Source ended after " << input_.gcount()
                             << " of " << wanted << " bytes for chunk " << next_index_;
    throw ProtocolError(ErrorKind::WRITE_ERROR,
                        "source ended inside chunk " + std::to_string(next_index_));
  }

  remaining_ -= wanted;
  ++next_index_;
  return chunk;
}

} // namespace transfer
} // namespace lbft
