#include "transfer/chunk_packing.hpp"
#include <boost/log/trivial.hpp>
#include <string>

namespace lbft {
namespace transfer {

using protocol::ErrorKind;
using protocol::ProtocolError;

protocol::ChunkPayload pack_chunk(const Chunk& chunk, bool compression,
                                  integrity::CompressionLevel level) {
  protocol::ChunkPayload payload;
  payload.index = chunk.index;
  payload.raw_length = static_cast<uint32_t>(chunk.data.size());

  if (compression && !chunk.data.empty()) {
    auto compressed = integrity::compress(chunk.data, level);
    if (compressed.size() < chunk.data.size()) {
      payload.compressed = true;
      payload.data = std::move(compressed);
      return payload;
    }
    BOOST_LOG_TRIVIAL(trace) << "Chunk packing: Chunk " << chunk.index
                             << " does not shrink under compression, sending raw";
  }

  payload.compressed = false;
  payload.data = chunk.data;
  return payload;
}

Chunk unpack_chunk(const protocol::ChunkPayload& payload, uint32_t chunk_size) {
  if (payload.raw_length > chunk_size) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "chunk " + std::to_string(payload.index) + " declares " +
                        std::to_string(payload.raw_length) + " bytes, above chunk size " +
                        std::to_string(chunk_size));
  }

  Chunk chunk;
  chunk.index = payload.index;
  chunk.compressed = payload.compressed;
  if (payload.compressed) {
    chunk.data = integrity::decompress(payload.data, chunk_size);
  } else {
    chunk.data = payload.data;
  }

  if (chunk.data.size() != payload.raw_length) {
    throw ProtocolError(ErrorKind::CORRUPT_PAYLOAD,
                        "chunk " + std::to_string(payload.index) + " carries " +
                        std::to_string(chunk.data.size()) + " bytes, declared " +
                        std::to_string(payload.raw_length));
  }
  return chunk;
}

} // namespace transfer
} // namespace lbft
