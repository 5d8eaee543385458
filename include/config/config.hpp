#ifndef LBFT_CONFIG_HPP
#define LBFT_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "integrity/compression.hpp"
#include "transfer/chunker.hpp"

namespace lbft {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Read-only protocol settings shared by every connection
struct ProtocolConfig {
  uint32_t chunk_size = transfer::DEFAULT_CHUNK_SIZE;
  bool compression_enabled = true;
  integrity::CompressionLevel compression_level = integrity::CompressionLevel::MEDIUM;
  std::chrono::milliseconds read_timeout{30000};
  std::chrono::milliseconds write_timeout{30000};
  std::string storage_root = "./shared_files";

  // Throws ConfigError when a value falls outside its allowed set
  void validate() const;
};

// Parses an integer command-line value, throws ConfigError with the flag name
long parse_number(const std::string& flag, const std::string& value);

// Applies one protocol flag shared by both executables (-d, -c, -z, -t).
// Returns false for flags it does not know.
bool apply_protocol_flag(ProtocolConfig& config, const std::string& flag, const std::string& value);

} // namespace config
} // namespace lbft

#endif // LBFT_CONFIG_HPP
