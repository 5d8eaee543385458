#include "client/client.hpp"
#include "network/connection.hpp"
#include "store/store.hpp"
#include "transfer/transfer_session.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace lbft {
namespace client {

using protocol::ErrorKind;
using protocol::MessageType;
using protocol::ProtocolError;
using protocol::ProtocolMessage;
using State = transfer::TransferState::State;

namespace {

bool is_request_rejection(ErrorKind kind) {
  return kind == ErrorKind::FILE_NOT_FOUND ||
         kind == ErrorKind::INVALID_FILENAME ||
         kind == ErrorKind::INVALID_CHUNK_SIZE;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(const config::ProtocolConfig& config)
  : config_(config) {
  config_.validate();
}

Client::Client(const config::ProtocolConfig& config,
               std::unique_ptr<transfer::MessageStream> stream)
  : config_(config)
  , stream_(std::move(stream)) {
  config_.validate();
}

Client::~Client() {
  if (stream_) {
    stream_->close();
  }
}


//==============================================
// CONNECTION OPERATIONS
//==============================================

void Client::connect(const std::string& host, uint16_t port) {
  if (stream_) {
    disconnect();
  }

  auto connection = std::make_unique<network::Connection>(config_.read_timeout,
                                                          config_.write_timeout);
  connection->connect(host, port);
  stream_ = std::move(connection);
  state_ = transfer::TransferState();
  BOOST_LOG_TRIVIAL(info) << "Client: Connected to " << host << ":" << port;
}

void Client::handshake() {
  require_connected();
  require_state(State::IDLE, "handshake");

  std::string version = protocol::ProtocolVersion::to_string();
  transition(State::HANDSHAKING);

  try {
    stream_->send(ProtocolMessage(MessageType::HANDSHAKE, protocol::encode_version(version)));
    ProtocolMessage reply = receive_expected(MessageType::HANDSHAKE_ACK);
    std::string accepted = protocol::decode_version(reply.payload);
    if (accepted.substr(0, accepted.find('.')) != std::to_string(protocol::ProtocolVersion::MAJOR)) {
      throw ProtocolError(ErrorKind::VERSION_UNSUPPORTED,
                          "server acknowledged version " + accepted);
    }
    transition(State::READY);
    BOOST_LOG_TRIVIAL(info) << "Client: Handshake complete, server speaks " << accepted;
  } catch (const RemoteError& e) {
    if (e.kind() == ErrorKind::VERSION_UNSUPPORTED) {
      // The server closes after refusing, the proposal just did not take
      state_.transition_to(State::IDLE);
      disconnect();
    } else {
      abort_transfer(e, true);
    }
    throw;
  } catch (const ProtocolError& e) {
    abort_transfer(e, false);
    throw;
  }
}

void Client::disconnect() {
  if (stream_) {
    stream_->close();
    stream_.reset();
    BOOST_LOG_TRIVIAL(info) << "Client: Disconnected";
  }
  state_ = transfer::TransferState();
}


//==============================================
// TRANSFER OPERATIONS
//==============================================

protocol::FileMetadata Client::download(const std::string& name,
                                        const std::filesystem::path& destination) {
  require_connected();
  require_state(State::READY, "download");
  protocol::validate_filename(name);

  protocol::FileRequest request;
  request.name = name;
  request.chunk_size = config_.chunk_size;
  request.compression = compression_requested();

  BOOST_LOG_TRIVIAL(info) << "Client: Requesting '" << name << "' into " << destination.string();
  transition(State::DOWNLOADING);

  bool awaiting_reply = true;
  std::unique_ptr<transfer::TransferSession> session;
  try {
    stream_->send(ProtocolMessage(MessageType::FILE_REQUEST, protocol::encode_file_request(request)));

    ProtocolMessage reply = receive_expected(MessageType::FILE_METADATA);
    awaiting_reply = false;

    protocol::FileMetadata metadata = protocol::decode_file_metadata(reply.payload);
    transfer::validate_metadata(metadata);
    if (metadata.name != name || metadata.chunk_size != request.chunk_size) {
      throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                          "metadata for '" + metadata.name + "' with chunk size " +
                          std::to_string(metadata.chunk_size) + " does not answer the request");
    }

    // Private file beside the destination so the final rename stays on one filesystem
    std::filesystem::path directory = destination.parent_path();
    if (directory.empty()) {
      directory = ".";
    }
    try {
      session = transfer::TransferSession::for_receiving(
        metadata, store::TempFile::create_in(directory, "." + destination.filename().string() + "."));
    } catch (const store::StoreError& e) {
      throw ProtocolError(ErrorKind::WRITE_ERROR, e.what());
    }

    BOOST_LOG_TRIVIAL(info) << "Client: Receiving " << metadata.total_size << " bytes in "
                            << metadata.chunk_count() << " chunks";

    while (!session->all_chunks_transferred()) {
      ProtocolMessage chunk = receive_expected(MessageType::FILE_CHUNK);
      session->receive_chunk(protocol::decode_chunk(chunk.payload));
      if (progress_) {
        progress_(session->bytes_transferred(), metadata.total_size);
      }
    }

    transition(State::VERIFYING);
    if (!session->verify()) {
      session->temp_file().discard();
      throw ProtocolError(ErrorKind::CHECKSUM_MISMATCH,
                          "digest of '" + name + "' does not match the server's");
    }

    try {
      session->temp_file().commit_to(destination);
    } catch (const store::StoreError& e) {
      throw ProtocolError(ErrorKind::WRITE_ERROR, e.what());
    }

    stream_->send(ProtocolMessage(MessageType::CHUNK_ACK,
      protocol::encode_chunk_ack(static_cast<uint32_t>(session->expected_chunks()))));

    transition(State::COMPLETE);
    transition(State::READY);
    BOOST_LOG_TRIVIAL(info) << "Client: Downloaded '" << name << "' ("
                            << metadata.total_size << " bytes)";
    return metadata;
  } catch (const RemoteError& e) {
    session.reset();
    if (awaiting_reply && is_request_rejection(e.kind())) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Request for '" << name << "' rejected: " << e.what();
      transition(State::READY);
    } else {
      abort_transfer(e, true);
    }
    throw;
  } catch (const ProtocolError& e) {
    // Dropping the session removes the partial download
    session.reset();
    abort_transfer(e, false);
    throw;
  }
}

protocol::FileMetadata Client::upload(const std::filesystem::path& source, const std::string& name) {
  require_connected();
  require_state(State::READY, "upload");
  protocol::validate_filename(name);

  auto input = std::make_unique<std::ifstream>(source, std::ios::binary);
  if (!*input) {
    throw ProtocolError(ErrorKind::FILE_NOT_FOUND, "cannot open local file " + source.string());
  }

  protocol::FileMetadata metadata = transfer::describe_source(name, *input, config_.chunk_size,
                                                              compression_requested());
  auto session = transfer::TransferSession::for_sending(metadata, std::move(input),
                                                        config_.compression_level);

  BOOST_LOG_TRIVIAL(info) << "Client: Uploading " << source.string() << " as '" << name << "', "
                          << metadata.total_size << " bytes in " << metadata.chunk_count()
                          << " chunks";
  transition(State::UPLOADING);

  try {
    stream_->send(ProtocolMessage(MessageType::UPLOAD_START));
    stream_->send(ProtocolMessage(MessageType::FILE_METADATA, protocol::encode_file_metadata(metadata)));

    while (auto chunk = session->next_chunk_message()) {
      stream_->send(*chunk);
      if (progress_) {
        progress_(session->bytes_transferred(), metadata.total_size);
      }
    }

    transition(State::VERIFYING);
    ProtocolMessage reply = receive_expected(MessageType::UPLOAD_COMPLETE);
    integrity::DigestValue confirmed = protocol::decode_upload_complete(reply.payload);
    if (confirmed != metadata.digest) {
      throw ProtocolError(ErrorKind::CHECKSUM_MISMATCH,
                          "server confirmed digest " + integrity::to_hex(confirmed));
    }

    transition(State::COMPLETE);
    transition(State::READY);
    BOOST_LOG_TRIVIAL(info) << "Client: Uploaded '" << name << "', digest "
                            << integrity::to_hex(confirmed);
    return metadata;
  } catch (const RemoteError& e) {
    abort_transfer(e, true);
    throw;
  } catch (const ProtocolError& e) {
    abort_transfer(e, false);
    throw;
  }
}

std::vector<protocol::ListEntry> Client::list() {
  require_connected();
  require_state(State::READY, "list");

  try {
    stream_->send(ProtocolMessage(MessageType::LIST_REQUEST));
    ProtocolMessage reply = receive_expected(MessageType::LIST_RESPONSE);
    auto entries = protocol::decode_list_response(reply.payload);
    BOOST_LOG_TRIVIAL(info) << "Client: Server offers " << entries.size() << " files";
    return entries;
  } catch (const RemoteError& e) {
    abort_transfer(e, true);
    throw;
  } catch (const ProtocolError& e) {
    abort_transfer(e, false);
    throw;
  }
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void Client::set_progress_callback(ProgressCallback callback) {
  progress_ = std::move(callback);
}


//==============================================
// UTILITY METHODS
//==============================================

void Client::require_connected() const {
  if (!stream_) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION, "client is not connected");
  }
}

void Client::require_state(State expected, const char* operation) const {
  if (state_.get_state() != expected) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        std::string(operation) + " needs state " +
                        transfer::TransferState::state_to_string(expected) + ", client is " +
                        state_.get_state_string());
  }
}

void Client::transition(State next) {
  State current = state_.get_state();
  if (!state_.transition_to(next)) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "invalid transition " + transfer::TransferState::state_to_string(current) +
                        " -> " + transfer::TransferState::state_to_string(next));
  }
  BOOST_LOG_TRIVIAL(trace) << "Client: " << current << " -> " << next;
}

ProtocolMessage Client::receive_expected(MessageType expected) {
  auto message = stream_->receive();
  if (!message) {
    throw ProtocolError(ErrorKind::TRUNCATED, std::string("server closed the connection while ") +
                        "waiting for " + protocol::message_type_to_string(expected));
  }

  if (message->type == MessageType::ERROR) {
    protocol::ErrorPayload error = protocol::decode_error(message->payload);
    BOOST_LOG_TRIVIAL(error) << "Client: Server reported " << error.kind << ": " << error.message;
    throw RemoteError(error.kind, error.message);
  }

  if (message->type != expected) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        std::string("expected ") + protocol::message_type_to_string(expected) +
                        ", got " + protocol::message_type_to_string(message->type));
  }
  return std::move(*message);
}

void Client::abort_transfer(const ProtocolError& error, bool remote) {
  BOOST_LOG_TRIVIAL(error) << "Client: Transfer failed in state " << state_.get_state() << ": "
                           << error.what();
  state_.fail();

  // Timeouts and broken sockets cannot carry the ERROR
  bool reachable = error.kind() != ErrorKind::TIMEOUT && error.kind() != ErrorKind::TRUNCATED &&
                   error.kind() != ErrorKind::WRITE_ERROR;
  if (!remote && reachable && stream_) {
    try {
      stream_->send(protocol::make_error_message(error.kind(), error.detail()));
    } catch (const ProtocolError& send_error) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Could not deliver ERROR to server: "
                                 << send_error.what();
    }
  }

  if (stream_) {
    stream_->close();
    stream_.reset();
  }
}

bool Client::compression_requested() const {
  return config_.compression_enabled &&
         config_.compression_level != integrity::CompressionLevel::NONE;
}

} // namespace client
} // namespace lbft
