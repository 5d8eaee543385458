#ifndef LBFT_NETWORK_CONNECTION_HPP
#define LBFT_NETWORK_CONNECTION_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "protocol/codec.hpp"
#include "transfer/message_sink.hpp"

namespace lbft {
namespace network {

/**
 * One TCP connection carrying framed protocol messages.
 *
 * Owns its io_context so that every blocking read and write can be bounded by a
 * timeout. Not thread-safe, except for cancel() which may be called from any thread.
 */
class Connection : public transfer::MessageStream {
public:
  // Delete copy operations to prevent socket duplication
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Connection(std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout,
             uint32_t max_payload_size = protocol::MAX_PAYLOAD_SIZE);
  ~Connection() override;


  // ---- CONNECTION INITIATION ----
  // Resolves and connects, throws TIMEOUT or WRITE_ERROR
  void connect(const std::string& host, uint16_t port);


  // ---- MESSAGE EXCHANGE ----
  // Writes one frame, throws TIMEOUT or WRITE_ERROR
  void send(const protocol::ProtocolMessage& message) override;
  // Reads one frame. nullopt on a clean close between frames, TRUNCATED when the peer
  // disconnects mid-frame, TIMEOUT when the read timeout expires.
  std::optional<protocol::ProtocolMessage> receive() override;


  // ---- TEARDOWN ----
  void close() override;
  // Closes the socket from another thread, pending operations fail
  void cancel();


  // ---- GETTERS ----
  bool is_open() const;
  boost::asio::ip::tcp::socket& get_socket();
  // "address:port" of the peer, empty when not connected
  std::string remote_address() const;

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  protocol::Codec codec_;
  std::chrono::milliseconds read_timeout_;
  std::chrono::milliseconds write_timeout_;


  // ---- UTILITY METHODS ----
  // Runs the pending operation, returns false when it was abandoned on timeout
  bool run_for(std::chrono::milliseconds timeout);
  // Reads exactly size bytes, returns the error and the byte count
  std::size_t read_exactly(uint8_t* data, std::size_t size, boost::system::error_code& ec);
};

} // namespace network
} // namespace lbft

#endif // LBFT_NETWORK_CONNECTION_HPP
