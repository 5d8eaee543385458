#include "config/config.hpp"
#include <boost/log/trivial.hpp>

namespace lbft {
namespace config {

void ProtocolConfig::validate() const {
  if (!transfer::is_allowed_chunk_size(chunk_size)) {
    throw ConfigError("Config: chunk size " + std::to_string(chunk_size) +
                      " is not one of 1024, 4096, 16384, 65536");
  }
  if (!integrity::compression_level_from_int(static_cast<int>(compression_level))) {
    throw ConfigError("Config: compression level must be 0, 1, 6 or 9");
  }
  if (read_timeout.count() <= 0 || write_timeout.count() <= 0) {
    throw ConfigError("Config: timeouts must be positive");
  }
  if (storage_root.empty()) {
    throw ConfigError("Config: storage root must not be empty");
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: chunk size " << chunk_size
                           << ", compression " << (compression_enabled ? "on" : "off")
                           << " (" << integrity::compression_level_to_string(compression_level) << ")"
                           << ", timeouts " << read_timeout.count() << "/" << write_timeout.count() << " ms";
}

long parse_number(const std::string& flag, const std::string& value) {
  try {
    std::size_t consumed = 0;
    long number = std::stol(value, &consumed);
    if (consumed != value.size()) {
      throw ConfigError("Config: Invalid value for " + flag + ": " + value);
    }
    return number;
  } catch (const std::logic_error&) {
    throw ConfigError("Config: Invalid value for " + flag + ": " + value);
  }
}

bool apply_protocol_flag(ProtocolConfig& config, const std::string& flag, const std::string& value) {
  if (flag == "-d" || flag == "--dir") {
    config.storage_root = value;
  } else if (flag == "-c" || flag == "--chunk-size") {
    long size = parse_number(flag, value);
    if (size <= 0 || size > static_cast<long>(UINT32_MAX)) {
      throw ConfigError("Config: Invalid value for " + flag + ": " + value);
    }
    config.chunk_size = static_cast<uint32_t>(size);
  } else if (flag == "-z" || flag == "--compression-level") {
    auto level = integrity::compression_level_from_int(static_cast<int>(parse_number(flag, value)));
    if (!level) {
      throw ConfigError("Config: compression level must be 0, 1, 6 or 9");
    }
    config.compression_level = *level;
    config.compression_enabled = *level != integrity::CompressionLevel::NONE;
  } else if (flag == "-t" || flag == "--timeout") {
    long seconds = parse_number(flag, value);
    if (seconds <= 0) {
      throw ConfigError("Config: timeouts must be positive");
    }
    config.read_timeout = std::chrono::seconds(seconds);
    config.write_timeout = std::chrono::seconds(seconds);
  } else {
    return false;
  }
  return true;
}

} // namespace config
} // namespace lbft
