#ifndef LBFT_TRANSFER_SERVER_PROTOCOL_HPP
#define LBFT_TRANSFER_SERVER_PROTOCOL_HPP

#include <memory>
#include <string>
#include "config/config.hpp"
#include "protocol/message.hpp"
#include "protocol/protocol_error.hpp"
#include "store/store.hpp"
#include "transfer/message_sink.hpp"
#include "transfer/transfer_session.hpp"
#include "transfer/transfer_state.hpp"

namespace lbft {
namespace transfer {

/**
 * Server side of the transfer protocol for a single connection.
 *
 * Consumes one decoded message at a time and writes every reply to the sink, so the
 * whole state machine runs without a socket. The owning connection handler stops
 * reading once should_close() turns true.
 */
class ServerProtocol {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ServerProtocol(store::Store& store, const config::ProtocolConfig& config, MessageSink& sink);


  // ---- MESSAGE HANDLING ----
  // Advances the state machine, protocol failures are reported to the peer and end the session
  void handle(const protocol::ProtocolMessage& message);

  // Connection-level failure (decode error, I/O error, timeout). The peer is sent an
  // ERROR when notify_peer is set.
  void fail(protocol::ErrorKind kind, const std::string& message, bool notify_peer = true);


  // ---- GETTERS ----
  TransferState::State state() const { return state_.get_state(); }
  bool should_close() const { return close_requested_; }
  const TransferSession* session() const { return session_.get(); }

private:
  // ---- HANDLERS PER STATE ----
  void handle_handshake(const protocol::ProtocolMessage& message);
  void handle_ready(const protocol::ProtocolMessage& message);
  void handle_file_request(const protocol::ProtocolMessage& message);
  void handle_download_verdict(const protocol::ProtocolMessage& message);
  void handle_uploading(const protocol::ProtocolMessage& message);
  void handle_peer_error(const protocol::ProtocolMessage& message);


  // ---- TRANSFER STEPS ----
  void stream_download();
  void begin_upload(const protocol::ProtocolMessage& message);
  void finish_upload();
  void complete_session();
  // Request-level rejection in READY, the connection stays usable
  void reject_request(protocol::ErrorKind kind, const std::string& message);


  // ---- UTILITY METHODS ----
  void transition(TransferState::State next);
  // Builds the PROTOCOL_VIOLATION for a message the current state does not accept
  protocol::ProtocolError unexpected(const protocol::ProtocolMessage& message) const;
  void send_error(protocol::ErrorKind kind, const std::string& message);


  // ---- PARAMETERS ----
  store::Store& store_;
  const config::ProtocolConfig& config_;
  MessageSink& sink_;
  TransferState state_;
  std::unique_ptr<TransferSession> session_;
  bool awaiting_metadata_ = false;
  bool close_requested_ = false;
};

} // namespace transfer
} // namespace lbft

#endif // LBFT_TRANSFER_SERVER_PROTOCOL_HPP
