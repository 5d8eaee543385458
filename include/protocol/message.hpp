#ifndef LBFT_PROTOCOL_MESSAGE_HPP
#define LBFT_PROTOCOL_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace lbft {
namespace protocol {

// Protocol version information
struct ProtocolVersion {
  static constexpr uint8_t MAJOR = 1;
  static constexpr uint8_t MINOR = 0;
  static constexpr uint8_t PATCH = 0;

  // Version string exchanged in HANDSHAKE / HANDSHAKE_ACK payloads
  static std::string to_string() {
    return std::to_string(MAJOR) + "." + std::to_string(MINOR) + "." + std::to_string(PATCH);
  }
};

// Version byte written in every frame header
constexpr uint8_t WIRE_VERSION = ProtocolVersion::MAJOR;

// [version: u8][type: u8][length: u32]
constexpr std::size_t HEADER_SIZE = sizeof(uint8_t) + sizeof(uint8_t) + sizeof(uint32_t);

// Upper bound on a single payload, larger declared lengths are rejected as malformed
constexpr uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

// Message type used to differentiate between protocol messages
enum class MessageType : uint8_t {
  HANDSHAKE = 0x01,
  HANDSHAKE_ACK = 0x02,
  FILE_REQUEST = 0x03,
  FILE_METADATA = 0x04,
  FILE_CHUNK = 0x05,
  CHUNK_ACK = 0x06,
  UPLOAD_START = 0x07,
  UPLOAD_COMPLETE = 0x08,
  LIST_REQUEST = 0x09,
  LIST_RESPONSE = 0x0A,
  ERROR = 0xFF
};

std::optional<MessageType> message_type_from_byte(uint8_t value);
const char* message_type_to_string(MessageType type);

inline std::ostream& operator<<(std::ostream& os, MessageType type) {
  os << message_type_to_string(type);
  return os;
}

// One discrete unit on the wire
struct ProtocolMessage {
  uint8_t version = WIRE_VERSION;
  MessageType type = MessageType::ERROR;
  std::vector<uint8_t> payload;

  ProtocolMessage() = default;
  ProtocolMessage(MessageType message_type, std::vector<uint8_t> message_payload = {})
    : type(message_type)
    , payload(std::move(message_payload)) {}
};

// Parsed fixed-size frame header
struct FrameHeader {
  uint8_t version;
  MessageType type;
  uint32_t length;
};

} // namespace protocol
} // namespace lbft

#endif // LBFT_PROTOCOL_MESSAGE_HPP
