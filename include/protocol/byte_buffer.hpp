#ifndef LBFT_PROTOCOL_BYTE_BUFFER_HPP
#define LBFT_PROTOCOL_BYTE_BUFFER_HPP

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "protocol/protocol_error.hpp"

namespace lbft {
namespace protocol {

// Appends fixed-width integers in network byte order to a payload buffer
class ByteWriter {
public:
  explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

  void write_u8(uint8_t value) { out_.push_back(value); }

  void write_u32(uint32_t value) {
    uint32_t network_value = boost::endian::native_to_big(value);
    write_raw(&network_value, sizeof(network_value));
  }

  void write_u64(uint64_t value) {
    uint64_t network_value = boost::endian::native_to_big(value);
    write_raw(&network_value, sizeof(network_value));
  }

  void write_i64(int64_t value) { write_u64(static_cast<uint64_t>(value)); }

  void write_bytes(const uint8_t* data, std::size_t size) { write_raw(data, size); }

  void write_bytes(const std::vector<uint8_t>& data) { write_raw(data.data(), data.size()); }

  // u32 length prefix followed by the raw string bytes
  void write_string(const std::string& value) {
    write_u32(static_cast<uint32_t>(value.size()));
    write_raw(value.data(), value.size());
  }

private:
  std::vector<uint8_t>& out_;

  void write_raw(const void* data, std::size_t size) {
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), bytes, bytes + size);
  }
};

// Reads fixed-width integers in network byte order from a payload buffer.
// Running past the end throws MALFORMED_MESSAGE.
class ByteReader {
public:
  ByteReader(const uint8_t* data, std::size_t size) : data_(data), size_(size), offset_(0) {}
  explicit ByteReader(const std::vector<uint8_t>& data) : ByteReader(data.data(), data.size()) {}

  uint8_t read_u8() {
    require(1);
    return data_[offset_++];
  }

  uint32_t read_u32() {
    uint32_t network_value;
    read_raw(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  uint64_t read_u64() {
    uint64_t network_value;
    read_raw(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  int64_t read_i64() { return static_cast<int64_t>(read_u64()); }

  std::vector<uint8_t> read_bytes(std::size_t size) {
    require(size);
    std::vector<uint8_t> bytes(data_ + offset_, data_ + offset_ + size);
    offset_ += size;
    return bytes;
  }

  std::string read_string() {
    uint32_t length = read_u32();
    require(length);
    std::string value(reinterpret_cast<const char*>(data_ + offset_), length);
    offset_ += length;
    return value;
  }

  // Consumes everything that is left
  std::vector<uint8_t> read_remaining() { return read_bytes(remaining()); }

  std::size_t remaining() const { return size_ - offset_; }

  // Payloads must be consumed exactly, trailing bytes are malformed
  void expect_end() const {
    if (remaining() != 0) {
      throw ProtocolError(ErrorKind::MALFORMED_MESSAGE,
                          std::to_string(remaining()) + " unexpected trailing payload bytes");
    }
  }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t offset_;

  void require(std::size_t size) const {
    if (size > remaining()) {
      throw ProtocolError(ErrorKind::MALFORMED_MESSAGE,
                          "payload too short: need " + std::to_string(size) +
                          " bytes, have " + std::to_string(remaining()));
    }
  }

  void read_raw(void* out, std::size_t size) {
    require(size);
    std::memcpy(out, data_ + offset_, size);
    offset_ += size;
  }
};

} // namespace protocol
} // namespace lbft

#endif // LBFT_PROTOCOL_BYTE_BUFFER_HPP
