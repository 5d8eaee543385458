#include "protocol/codec.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <string>

namespace lbft {
namespace protocol {

std::optional<MessageType> message_type_from_byte(uint8_t value) {
  switch (static_cast<MessageType>(value)) {
    case MessageType::HANDSHAKE:
    case MessageType::HANDSHAKE_ACK:
    case MessageType::FILE_REQUEST:
    case MessageType::FILE_METADATA:
    case MessageType::FILE_CHUNK:
    case MessageType::CHUNK_ACK:
    case MessageType::UPLOAD_START:
    case MessageType::UPLOAD_COMPLETE:
    case MessageType::LIST_REQUEST:
    case MessageType::LIST_RESPONSE:
    case MessageType::ERROR:
      return static_cast<MessageType>(value);
  }
  return std::nullopt;
}

const char* message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::HANDSHAKE:       return "HANDSHAKE";
    case MessageType::HANDSHAKE_ACK:   return "HANDSHAKE_ACK";
    case MessageType::FILE_REQUEST:    return "FILE_REQUEST";
    case MessageType::FILE_METADATA:   return "FILE_METADATA";
    case MessageType::FILE_CHUNK:      return "FILE_CHUNK";
    case MessageType::CHUNK_ACK:       return "CHUNK_ACK";
    case MessageType::UPLOAD_START:    return "UPLOAD_START";
    case MessageType::UPLOAD_COMPLETE: return "UPLOAD_COMPLETE";
    case MessageType::LIST_REQUEST:    return "LIST_REQUEST";
    case MessageType::LIST_RESPONSE:   return "LIST_RESPONSE";
    case MessageType::ERROR:           return "ERROR";
  }
  return "UNKNOWN";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Codec::Codec(uint32_t max_payload_size) : max_payload_size_(max_payload_size) {}


//==============================================
// ENCODING
//==============================================

std::vector<uint8_t> Codec::encode(const ProtocolMessage& message) const {
  if (message.payload.size() > max_payload_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Payload of " << message.payload.size() << " bytes exceeds limit";
    throw ProtocolError(ErrorKind::MALFORMED_MESSAGE, "payload exceeds maximum frame size");
  }

  std::vector<uint8_t> bytes(HEADER_SIZE + message.payload.size());
  bytes[0] = message.version;
  bytes[1] = static_cast<uint8_t>(message.type);
  uint32_t network_length = to_network_order(static_cast<uint32_t>(message.payload.size()));
  std::memcpy(bytes.data() + 2, &network_length, sizeof(network_length));
  if (!message.payload.empty()) {
    std::memcpy(bytes.data() + HEADER_SIZE, message.payload.data(), message.payload.size());
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Encoded " << message.type << " with "
                           << message.payload.size() << " payload bytes";
  return bytes;
}

std::size_t Codec::serialize(const ProtocolMessage& message, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw ProtocolError(ErrorKind::WRITE_ERROR, "invalid output stream");
  }

  auto bytes = encode(message);
  write_bytes(output, bytes.data(), bytes.size());
  output.flush();
  return bytes.size();
}


//==============================================
// DECODING
//==============================================

FrameHeader Codec::decode_header(const uint8_t* data) const {
  FrameHeader header;
  header.version = data[0];

  auto type = message_type_from_byte(data[1]);
  if (!type) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unknown message type: " << static_cast<int>(data[1]);
    throw ProtocolError(ErrorKind::MALFORMED_MESSAGE,
                        "unknown message type " + std::to_string(static_cast<int>(data[1])));
  }
  header.type = *type;

  if (header.version != WIRE_VERSION) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Frame version " << static_cast<int>(header.version)
                               << " does not match " << static_cast<int>(WIRE_VERSION);
    // Only a handshake can be answered with a distinct version rejection
    if (header.type == MessageType::HANDSHAKE) {
      throw ProtocolError(ErrorKind::VERSION_UNSUPPORTED,
                          "protocol version " + std::to_string(static_cast<int>(header.version)) +
                          " is not supported");
    }
    throw ProtocolError(ErrorKind::MALFORMED_MESSAGE, "unexpected frame version");
  }

  uint32_t network_length;
  std::memcpy(&network_length, data + 2, sizeof(network_length));
  header.length = from_network_order(network_length);
  if (header.length > max_payload_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Declared payload length " << header.length << " exceeds limit";
    throw ProtocolError(ErrorKind::MALFORMED_MESSAGE, "declared payload length exceeds maximum");
  }

  return header;
}

std::optional<DecodedMessage> Codec::try_decode(const uint8_t* data, std::size_t size) const {
  if (size < HEADER_SIZE) {
    return std::nullopt;
  }

  FrameHeader header = decode_header(data);
  if (size < HEADER_SIZE + header.length) {
    return std::nullopt;
  }

  DecodedMessage decoded;
  decoded.message.version = header.version;
  decoded.message.type = header.type;
  decoded.message.payload.assign(data + HEADER_SIZE, data + HEADER_SIZE + header.length);
  decoded.bytes_consumed = HEADER_SIZE + header.length;
  return decoded;
}

ProtocolMessage Codec::decode(const std::vector<uint8_t>& bytes) const {
  auto decoded = try_decode(bytes.data(), bytes.size());
  if (!decoded) {
    throw ProtocolError(ErrorKind::TRUNCATED,
                        "buffer of " + std::to_string(bytes.size()) + " bytes holds no complete frame");
  }
  if (decoded->bytes_consumed != bytes.size()) {
    throw ProtocolError(ErrorKind::MALFORMED_MESSAGE, "payload length does not match buffer size");
  }
  return std::move(decoded->message);
}

ProtocolMessage Codec::deserialize(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw ProtocolError(ErrorKind::TRUNCATED, "invalid input stream");
  }

  uint8_t header_bytes[HEADER_SIZE];
  read_bytes(input, header_bytes, HEADER_SIZE);
  FrameHeader header = decode_header(header_bytes);

  ProtocolMessage message;
  message.version = header.version;
  message.type = header.type;
  message.payload.resize(header.length);
  if (header.length > 0) {
    read_bytes(input, message.payload.data(), header.length);
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Deserialized " << message.type << " with "
                           << header.length << " payload bytes";
  return message;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) const {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw ProtocolError(ErrorKind::WRITE_ERROR, "failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) const {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Stream ended after " << input.gcount() << " of " << size << " bytes";
    throw ProtocolError(ErrorKind::TRUNCATED, "stream ended before the frame was complete");
  }
}

} // namespace protocol
} // namespace lbft
