#ifndef LBFT_INTEGRITY_COMPRESSION_HPP
#define LBFT_INTEGRITY_COMPRESSION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lbft {
namespace integrity {

// zlib compression levels accepted by the protocol
enum class CompressionLevel : int {
  NONE = 0,
  LOW = 1,
  MEDIUM = 6,
  HIGH = 9
};

std::optional<CompressionLevel> compression_level_from_int(int value);
const char* compression_level_to_string(CompressionLevel level);

// Compresses a buffer into a zlib stream
std::vector<uint8_t> compress(const std::vector<uint8_t>& bytes, CompressionLevel level);

// Inflates a zlib stream, throws CORRUPT_PAYLOAD on malformed, truncated or trailing input.
// max_output bounds the inflated size, exceeding it is treated as corrupt.
std::vector<uint8_t> decompress(const std::vector<uint8_t>& bytes,
                                std::size_t max_output = 64 * 1024 * 1024);

} // namespace integrity
} // namespace lbft

#endif // LBFT_INTEGRITY_COMPRESSION_HPP
