#ifndef LBFT_CLIENT_HPP
#define LBFT_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "protocol/message.hpp"
#include "protocol/payloads.hpp"
#include "protocol/protocol_error.hpp"
#include "transfer/message_sink.hpp"
#include "transfer/transfer_state.hpp"

namespace lbft {
namespace client {

// Failure reported by the server in an ERROR message
class RemoteError : public protocol::ProtocolError {
public:
  RemoteError(protocol::ErrorKind kind, const std::string& message)
    : protocol::ProtocolError(kind, message) {}
};

/**
 * Client side of the transfer protocol over one connection.
 *
 * Every operation blocks until the exchange finishes and throws ProtocolError (or
 * RemoteError for failures the server reported) carrying the error kind. After a
 * failure the client is in FAILED and must reconnect; the request-level rejections
 * FILE_NOT_FOUND, INVALID_FILENAME and INVALID_CHUNK_SIZE leave it READY.
 */
class Client {
public:
  // Called after every chunk with bytes done and total bytes
  using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Client(const config::ProtocolConfig& config);
  // Runs over an already open stream, used by tests without sockets
  Client(const config::ProtocolConfig& config, std::unique_ptr<transfer::MessageStream> stream);
  ~Client();


  // ---- CONNECTION OPERATIONS ----
  void connect(const std::string& host, uint16_t port);
  // Proposes the protocol version, throws VERSION_UNSUPPORTED when refused
  void handshake();
  void disconnect();


  // ---- TRANSFER OPERATIONS ----
  // Downloads name into destination, which only appears once the digest matched
  protocol::FileMetadata download(const std::string& name, const std::filesystem::path& destination);
  // Uploads a local file under name, returns the metadata the server confirmed
  protocol::FileMetadata upload(const std::filesystem::path& source, const std::string& name);
  // Files the server offers, ordered by name
  std::vector<protocol::ListEntry> list();


  // ---- GETTERS AND SETTERS ----
  transfer::TransferState::State state() const { return state_.get_state(); }
  bool is_connected() const { return stream_ != nullptr; }
  void set_progress_callback(ProgressCallback callback);

private:
  // ---- PARAMETERS ----
  config::ProtocolConfig config_;
  std::unique_ptr<transfer::MessageStream> stream_;
  transfer::TransferState state_;
  ProgressCallback progress_;


  // ---- UTILITY METHODS ----
  void require_connected() const;
  void require_state(transfer::TransferState::State expected, const char* operation) const;
  void transition(transfer::TransferState::State next);
  // Receives the next message, turning ERROR into RemoteError and anything but expected
  // into PROTOCOL_VIOLATION
  protocol::ProtocolMessage receive_expected(protocol::MessageType expected);
  // Moves to FAILED, tells the server when the failure is local and the socket usable
  void abort_transfer(const protocol::ProtocolError& error, bool remote);
  bool compression_requested() const;
};

} // namespace client
} // namespace lbft

#endif // LBFT_CLIENT_HPP
