#ifndef LBFT_TRANSFER_CHUNKER_HPP
#define LBFT_TRANSFER_CHUNKER_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

namespace lbft {
namespace transfer {

// Available chunk sizes for data transmission
enum class ChunkSize : uint32_t {
  SMALL = 1024,     // ultra-low bandwidth
  MEDIUM = 4096,    // low bandwidth
  LARGE = 16384,    // normal bandwidth
  XLARGE = 65536    // high bandwidth
};

constexpr std::array<uint32_t, 4> ALLOWED_CHUNK_SIZES = {
  static_cast<uint32_t>(ChunkSize::SMALL),
  static_cast<uint32_t>(ChunkSize::MEDIUM),
  static_cast<uint32_t>(ChunkSize::LARGE),
  static_cast<uint32_t>(ChunkSize::XLARGE)
};

constexpr uint32_t DEFAULT_CHUNK_SIZE = static_cast<uint32_t>(ChunkSize::MEDIUM);

bool is_allowed_chunk_size(uint64_t chunk_size);
// Throws INVALID_CHUNK_SIZE for sizes outside the allowed set
void validate_chunk_size(uint64_t chunk_size);

// Ordered unit of file data
struct Chunk {
  uint32_t index = 0;
  std::vector<uint8_t> data;
  bool compressed = false;
};

class Chunker {
public:
  // Splits bytes into chunk_size pieces, the last one may be short
  static std::vector<Chunk> split(const std::vector<uint8_t>& file_bytes, uint32_t chunk_size);
  // Concatenates chunks presented in index order 0..n-1
  static std::vector<uint8_t> join(const std::vector<Chunk>& chunks);
  // Number of chunks for a file of total_size bytes
  static uint64_t chunk_count(uint64_t total_size, uint32_t chunk_size);
};

// Reads a stream one chunk at a time so senders never hold more than one chunk
class ChunkReader {
public:
  ChunkReader(std::istream& input, uint64_t total_size, uint32_t chunk_size);

  // Next chunk in order, nullopt once total_size bytes have been produced
  std::optional<Chunk> next();

  uint32_t chunks_read() const { return next_index_; }

private:
  std::istream& input_;
  uint64_t remaining_;
  uint32_t chunk_size_;
  uint32_t next_index_ = 0;
};

} // namespace transfer
} // namespace lbft

#endif // LBFT_TRANSFER_CHUNKER_HPP
