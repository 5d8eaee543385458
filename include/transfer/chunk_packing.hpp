#ifndef LBFT_TRANSFER_CHUNK_PACKING_HPP
#define LBFT_TRANSFER_CHUNK_PACKING_HPP

#include "integrity/compression.hpp"
#include "protocol/payloads.hpp"
#include "transfer/chunker.hpp"

namespace lbft {
namespace transfer {

// Builds the wire form of a chunk. With compression enabled the payload is
// compressed unless that does not make it smaller, in which case it goes raw.
protocol::ChunkPayload pack_chunk(const Chunk& chunk, bool compression,
                                  integrity::CompressionLevel level);

// Recovers the raw chunk bytes. Throws CORRUPT_PAYLOAD when inflation fails or
// the raw length does not match, PROTOCOL_VIOLATION when it exceeds chunk_size.
Chunk unpack_chunk(const protocol::ChunkPayload& payload, uint32_t chunk_size);

} // namespace transfer
} // namespace lbft

#endif // LBFT_TRANSFER_CHUNK_PACKING_HPP
