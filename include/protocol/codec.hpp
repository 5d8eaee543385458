#ifndef LBFT_PROTOCOL_CODEC_HPP
#define LBFT_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "protocol/message.hpp"
#include "protocol/protocol_error.hpp"

namespace lbft {
namespace protocol {

// Result of decoding one frame out of a larger receive buffer
struct DecodedMessage {
  ProtocolMessage message;
  std::size_t bytes_consumed;
};

class Codec {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Codec(uint32_t max_payload_size = MAX_PAYLOAD_SIZE);


  // ---- ENCODING ----
  // Encodes header and payload into a single buffer
  std::vector<uint8_t> encode(const ProtocolMessage& message) const;
  // Serializes a message to an output stream, returns bytes written
  std::size_t serialize(const ProtocolMessage& message, std::ostream& output) const;


  // ---- DECODING ----
  // Decodes a buffer holding exactly one frame
  ProtocolMessage decode(const std::vector<uint8_t>& bytes) const;
  // Decodes the first frame of a buffer, nullopt until the whole frame is buffered
  std::optional<DecodedMessage> try_decode(const uint8_t* data, std::size_t size) const;
  // Reads exactly one frame from a blocking stream
  ProtocolMessage deserialize(std::istream& input) const;
  // Parses and validates the fixed-size header, data must hold HEADER_SIZE bytes
  FrameHeader decode_header(const uint8_t* data) const;

private:
  // ---- PARAMETERS ----
  uint32_t max_payload_size_;


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size) const;
  // Reads bytes from an input stream, a short read is TRUNCATED
  void read_bytes(std::istream& input, void* data, std::size_t size) const;


  // ---- BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace protocol
} // namespace lbft

#endif // LBFT_PROTOCOL_CODEC_HPP
