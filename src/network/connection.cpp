#include "network/connection.hpp"
#include <boost/log/trivial.hpp>

namespace lbft {
namespace network {

using protocol::ErrorKind;
using protocol::ProtocolError;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Connection::Connection(std::chrono::milliseconds read_timeout,
                       std::chrono::milliseconds write_timeout,
                       uint32_t max_payload_size)
  : socket_(std::make_unique<boost::asio::ip::tcp::socket>(io_context_))
  , codec_(max_payload_size)
  , read_timeout_(read_timeout)
  , write_timeout_(write_timeout) {
  BOOST_LOG_TRIVIAL(debug) << "Connection: Created with timeouts " << read_timeout_.count()
                           << "/" << write_timeout_.count() << " ms";
}

Connection::~Connection() {
  close();
}


//==============================================
// CONNECTION INITIATION
//==============================================

void Connection::connect(const std::string& host, uint16_t port) {
  BOOST_LOG_TRIVIAL(info) << "Connection: Resolving " << host << ":" << port;

  boost::asio::ip::tcp::resolver resolver(io_context_);
  boost::system::error_code ec;
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    throw ProtocolError(ErrorKind::WRITE_ERROR, "cannot resolve " + host + ": " + ec.message());
  }

  boost::asio::async_connect(*socket_, endpoints,
    [&ec](const boost::system::error_code& error, const boost::asio::ip::tcp::endpoint&) {
      ec = error;
    });

  if (!run_for(write_timeout_)) {
    throw ProtocolError(ErrorKind::TIMEOUT, "connect to " + host + ":" + std::to_string(port) +
                        " timed out");
  }
  if (ec) {
    throw ProtocolError(ErrorKind::WRITE_ERROR, "connect to " + host + ":" +
                        std::to_string(port) + " failed: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Connection: Connected to " << remote_address();
}


//==============================================
// MESSAGE EXCHANGE
//==============================================

void Connection::send(const protocol::ProtocolMessage& message) {
  if (!is_open()) {
    throw ProtocolError(ErrorKind::WRITE_ERROR, "connection is closed");
  }

  std::vector<uint8_t> frame = codec_.encode(message);
  boost::system::error_code ec;
  std::size_t written = 0;

  boost::asio::async_write(*socket_, boost::asio::buffer(frame),
    [&ec, &written](const boost::system::error_code& error, std::size_t bytes_transferred) {
      ec = error;
      written = bytes_transferred;
    });

  if (!run_for(write_timeout_)) {
    throw ProtocolError(ErrorKind::TIMEOUT, "write timed out after " +
                        std::to_string(write_timeout_.count()) + " ms");
  }
  if (ec || written != frame.size()) {
    BOOST_LOG_TRIVIAL(error) << "Connection: Send error: " << ec.message();
    throw ProtocolError(ErrorKind::WRITE_ERROR, "send failed: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "Connection: Sent " << message.type << " (" << frame.size()
                           << " bytes)";
}

std::optional<protocol::ProtocolMessage> Connection::receive() {
  if (!is_open()) {
    throw ProtocolError(ErrorKind::TRUNCATED, "connection is closed");
  }

  uint8_t header_bytes[protocol::HEADER_SIZE];
  boost::system::error_code ec;
  std::size_t got = read_exactly(header_bytes, sizeof(header_bytes), ec);

  if (ec) {
    bool closed = ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset;
    if (closed && got == 0) {
      BOOST_LOG_TRIVIAL(debug) << "Connection: Peer closed the connection";
      return std::nullopt;
    }
    throw ProtocolError(ErrorKind::TRUNCATED, "frame header cut off after " +
                        std::to_string(got) + " bytes: " + ec.message());
  }

  protocol::FrameHeader header = codec_.decode_header(header_bytes);

  protocol::ProtocolMessage message;
  message.version = header.version;
  message.type = header.type;
  message.payload.resize(header.length);

  if (header.length > 0) {
    got = read_exactly(message.payload.data(), header.length, ec);
    if (ec) {
      throw ProtocolError(ErrorKind::TRUNCATED, "payload cut off after " + std::to_string(got) +
                          " of " + std::to_string(header.length) + " bytes: " + ec.message());
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Connection: Received " << message.type << " ("
                           << header.length << " byte payload)";
  return message;
}

std::size_t Connection::read_exactly(uint8_t* data, std::size_t size,
                                     boost::system::error_code& ec) {
  std::size_t got = 0;
  boost::asio::async_read(*socket_, boost::asio::buffer(data, size),
    [&ec, &got](const boost::system::error_code& error, std::size_t bytes_transferred) {
      ec = error;
      got = bytes_transferred;
    });

  if (!run_for(read_timeout_)) {
    throw ProtocolError(ErrorKind::TIMEOUT, "read timed out after " +
                        std::to_string(read_timeout_.count()) + " ms");
  }
  return got;
}


//==============================================
// TEARDOWN
//==============================================

void Connection::close() {
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;

    // Shutdown both send and receive operations
    socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "Connection: Socket shutdown error: " << ec.message();
    }

    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Connection: Socket close error: " << ec.message();
    }
  }
}

void Connection::cancel() {
  // Runs on the thread driving io_context_, the next time it runs
  boost::asio::post(io_context_, [this]() {
    boost::system::error_code ec;
    socket_->close(ec);
  });
}


//==============================================
// GETTERS
//==============================================

bool Connection::is_open() const {
  return socket_ && socket_->is_open();
}

boost::asio::ip::tcp::socket& Connection::get_socket() {
  return *socket_;
}

std::string Connection::remote_address() const {
  boost::system::error_code ec;
  auto endpoint = socket_->remote_endpoint(ec);
  if (ec) {
    return "";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}


//==============================================
// UTILITY METHODS
//==============================================

bool Connection::run_for(std::chrono::milliseconds timeout) {
  io_context_.restart();
  io_context_.run_for(timeout);

  // The io_context stops by itself once the operation's handler has run
  if (io_context_.stopped()) {
    return true;
  }

  BOOST_LOG_TRIVIAL(warning) << "Connection: Operation timed out after " << timeout.count() << " ms";
  boost::system::error_code ec;
  socket_->close(ec);
  // Drain the aborted handler before the caller's buffers go out of scope
  io_context_.restart();
  io_context_.run();
  return false;
}

} // namespace network
} // namespace lbft
