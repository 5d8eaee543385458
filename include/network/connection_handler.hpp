#ifndef LBFT_NETWORK_CONNECTION_HANDLER_HPP
#define LBFT_NETWORK_CONNECTION_HANDLER_HPP

#include <atomic>
#include <string>
#include "config/config.hpp"
#include "network/connection.hpp"
#include "store/store.hpp"
#include "transfer/server_protocol.hpp"

namespace lbft {
namespace network {

// Serves one accepted connection: reads frames and feeds them to the server protocol
// until the protocol asks to close, the peer leaves or an error ends the session.
class ConnectionHandler {
public:
  ConnectionHandler(const ConnectionHandler&) = delete;
  ConnectionHandler& operator=(const ConnectionHandler&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConnectionHandler(store::Store& store, const config::ProtocolConfig& config);


  // ---- CONNECTION LIFECYCLE ----
  // Blocking receive loop, runs on the connection's own thread
  void run();
  // Asks a running handler to stop, callable from any thread
  void stop();


  // ---- GETTERS ----
  Connection& connection() { return connection_; }
  bool finished() const { return finished_; }
  transfer::TransferState::State state() const { return protocol_.state(); }

private:
  // ---- PARAMETERS ----
  Connection connection_;
  transfer::ServerProtocol protocol_;
  std::string peer_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> finished_{false};
};

} // namespace network
} // namespace lbft

#endif // LBFT_NETWORK_CONNECTION_HANDLER_HPP
