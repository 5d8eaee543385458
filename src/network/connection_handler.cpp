#include "network/connection_handler.hpp"
#include <boost/log/trivial.hpp>

namespace lbft {
namespace network {

using protocol::ErrorKind;
using protocol::ProtocolError;
using State = transfer::TransferState::State;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConnectionHandler::ConnectionHandler(store::Store& store, const config::ProtocolConfig& config)
  : connection_(config.read_timeout, config.write_timeout)
  , protocol_(store, config, connection_) {}


//==============================================
// CONNECTION LIFECYCLE
//==============================================

void ConnectionHandler::run() {
  peer_ = connection_.remote_address();
  BOOST_LOG_TRIVIAL(info) << "Connection handler: Serving " << peer_;

  try {
    while (!stop_requested_ && !protocol_.should_close()) {
      auto message = connection_.receive();
      if (!message) {
        State state = protocol_.state();
        if (state == State::DOWNLOADING || state == State::UPLOADING || state == State::VERIFYING) {
          protocol_.fail(ErrorKind::TRUNCATED, "peer left during a transfer", false);
        }
        BOOST_LOG_TRIVIAL(info) << "Connection handler: " << peer_ << " closed the connection";
        break;
      }
      protocol_.handle(*message);
    }
  } catch (const ProtocolError& e) {
    if (stop_requested_) {
      BOOST_LOG_TRIVIAL(info) << "Connection handler: Stopped while serving " << peer_;
      protocol_.fail(e.kind(), "server shutting down", false);
    } else {
      // A dead or silent socket cannot carry the ERROR
      bool reachable = e.kind() != ErrorKind::TRUNCATED && e.kind() != ErrorKind::TIMEOUT &&
                       e.kind() != ErrorKind::WRITE_ERROR;
      protocol_.fail(e.kind(), e.detail(), reachable);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection handler: Unexpected error for " << peer_ << ": "
                             << e.what();
    protocol_.fail(ErrorKind::WRITE_ERROR, e.what());
  }

  connection_.close();
  BOOST_LOG_TRIVIAL(info) << "Connection handler: Connection to " << peer_ << " closed in state "
                          << protocol_.state();
  finished_ = true;
}

void ConnectionHandler::stop() {
  stop_requested_ = true;
  connection_.cancel();
}

} // namespace network
} // namespace lbft
