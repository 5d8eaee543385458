#ifndef LBFT_PROTOCOL_ERROR_HPP
#define LBFT_PROTOCOL_ERROR_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace lbft {
namespace protocol {

// Error kinds carried in ERROR messages, values are the wire codes
enum class ErrorKind : uint8_t {
  VERSION_UNSUPPORTED = 1,
  MALFORMED_MESSAGE = 2,
  TRUNCATED = 3,
  INVALID_CHUNK_SIZE = 4,
  INVALID_FILENAME = 5,
  FILE_NOT_FOUND = 6,
  MISSING_CHUNK = 7,
  OUT_OF_ORDER = 8,
  CORRUPT_PAYLOAD = 9,
  CHECKSUM_MISMATCH = 10,
  WRITE_ERROR = 11,
  PROTOCOL_VIOLATION = 12,
  TIMEOUT = 13
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::VERSION_UNSUPPORTED: return "VERSION_UNSUPPORTED";
    case ErrorKind::MALFORMED_MESSAGE: return "MALFORMED_MESSAGE";
    case ErrorKind::TRUNCATED: return "TRUNCATED";
    case ErrorKind::INVALID_CHUNK_SIZE: return "INVALID_CHUNK_SIZE";
    case ErrorKind::INVALID_FILENAME: return "INVALID_FILENAME";
    case ErrorKind::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
    case ErrorKind::MISSING_CHUNK: return "MISSING_CHUNK";
    case ErrorKind::OUT_OF_ORDER: return "OUT_OF_ORDER";
    case ErrorKind::CORRUPT_PAYLOAD: return "CORRUPT_PAYLOAD";
    case ErrorKind::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
    case ErrorKind::WRITE_ERROR: return "WRITE_ERROR";
    case ErrorKind::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
    case ErrorKind::TIMEOUT: return "TIMEOUT";
    default: return "UNKNOWN";
  }
}

// Maps a wire code back to an ErrorKind, nullopt for unknown codes
inline std::optional<ErrorKind> error_kind_from_code(uint8_t code) {
  if (code < static_cast<uint8_t>(ErrorKind::VERSION_UNSUPPORTED) ||
      code > static_cast<uint8_t>(ErrorKind::TIMEOUT)) {
    return std::nullopt;
  }
  return static_cast<ErrorKind>(code);
}

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  os << error_kind_to_string(kind);
  return os;
}

class ProtocolError : public std::runtime_error {
public:
  ProtocolError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
    , kind_(kind)
    , detail_(message) {}

  ErrorKind kind() const { return kind_; }
  // Message without the kind prefix, as sent in ERROR payloads
  const std::string& detail() const { return detail_; }

private:
  ErrorKind kind_;
  std::string detail_;
};

} // namespace protocol
} // namespace lbft

#endif // LBFT_PROTOCOL_ERROR_HPP
