#include "integrity/compression.hpp"
#include "protocol/protocol_error.hpp"
#include <zlib.h>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace lbft {
namespace integrity {

using protocol::ErrorKind;
using protocol::ProtocolError;

std::optional<CompressionLevel> compression_level_from_int(int value) {
  switch (value) {
    case 0: return CompressionLevel::NONE;
    case 1: return CompressionLevel::LOW;
    case 6: return CompressionLevel::MEDIUM;
    case 9: return CompressionLevel::HIGH;
    default: return std::nullopt;
  }
}

const char* compression_level_to_string(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::NONE:   return "NONE";
    case CompressionLevel::LOW:    return "LOW";
    case CompressionLevel::MEDIUM: return "MEDIUM";
    case CompressionLevel::HIGH:   return "HIGH";
    default:                       return "UNKNOWN";
  }
}

std::vector<uint8_t> compress(const std::vector<uint8_t>& bytes, CompressionLevel level) {
  if (!compression_level_from_int(static_cast<int>(level))) {
    throw std::invalid_argument("Compression: unsupported compression level");
  }

  uLongf capacity = compressBound(static_cast<uLong>(bytes.size()));
  std::vector<uint8_t> out(capacity);

  int result = compress2(out.data(), &capacity,
                         bytes.data(), static_cast<uLong>(bytes.size()),
                         static_cast<int>(level));
  if (result != Z_OK) {
    BOOST_LOG_TRIVIAL(error) << "Compression: compress2 failed with code " << result;
    throw std::runtime_error("Compression: zlib compression failed");
  }

  out.resize(capacity);
  BOOST_LOG_TRIVIAL(trace) << "Compression: " << bytes.size() << " -> " << out.size() << " bytes";
  return out;
}

std::vector<uint8_t> decompress(const std::vector<uint8_t>& bytes, std::size_t max_output) {
  z_stream stream{};
  if (inflateInit(&stream) != Z_OK) {
    throw std::runtime_error("Compression: Failed to initialize inflate stream");
  }

  stream.next_in = const_cast<Bytef*>(bytes.data());
  stream.avail_in = static_cast<uInt>(bytes.size());

  std::vector<uint8_t> out;
  uint8_t buffer[16384];
  int result = Z_OK;

  // Inflate in blocks until the end of the zlib stream
  while (result != Z_STREAM_END) {
    stream.next_out = buffer;
    stream.avail_out = sizeof(buffer);

    result = inflate(&stream, Z_NO_FLUSH);
    if (result != Z_OK && result != Z_STREAM_END) {
      inflateEnd(&stream);
      BOOST_LOG_TRIVIAL(warning) << "Compression: inflate failed with code " << result;
      throw ProtocolError(ErrorKind::CORRUPT_PAYLOAD, "malformed compressed data");
    }

    std::size_t produced = sizeof(buffer) - stream.avail_out;
    out.insert(out.end(), buffer, buffer + produced);

    if (out.size() > max_output) {
      inflateEnd(&stream);
      throw ProtocolError(ErrorKind::CORRUPT_PAYLOAD, "compressed data inflates beyond limit");
    }

    // No progress and no input left means the stream was cut short
    if (result == Z_OK && produced == 0 && stream.avail_in == 0) {
      inflateEnd(&stream);
      throw ProtocolError(ErrorKind::CORRUPT_PAYLOAD, "truncated compressed data");
    }
  }

  std::size_t trailing = stream.avail_in;
  inflateEnd(&stream);

  if (trailing != 0) {
    throw ProtocolError(ErrorKind::CORRUPT_PAYLOAD, "trailing bytes after compressed data");
  }
  return out;
}

} // namespace integrity
} // namespace lbft
