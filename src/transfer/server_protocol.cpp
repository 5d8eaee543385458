#include "transfer/server_protocol.hpp"
#include "protocol/payloads.hpp"
#include <boost/log/trivial.hpp>

namespace lbft {
namespace transfer {

using protocol::ErrorKind;
using protocol::MessageType;
using protocol::ProtocolError;
using protocol::ProtocolMessage;
using State = TransferState::State;

namespace {

// Major component of a "major.minor.patch" version string, nullopt when unparsable
std::optional<unsigned long> parse_major(const std::string& version) {
  std::string major = version.substr(0, version.find('.'));
  if (major.empty() || major.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoul(major);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ServerProtocol::ServerProtocol(store::Store& store, const config::ProtocolConfig& config,
                               MessageSink& sink)
  : store_(store)
  , config_(config)
  , sink_(sink) {}


//==============================================
// MESSAGE HANDLING
//==============================================

void ServerProtocol::handle(const ProtocolMessage& message) {
  BOOST_LOG_TRIVIAL(debug) << "ServerProtocol: Received " << message.type << " ("
                           << message.payload.size() << " bytes) in state " << state_.get_state();

  if (close_requested_) {
    BOOST_LOG_TRIVIAL(warning) << "ServerProtocol: Ignoring " << message.type
                               << " after the connection was marked for close";
    return;
  }

  try {
    if (message.type == MessageType::ERROR) {
      handle_peer_error(message);
      return;
    }

    switch (state_.get_state()) {
      case State::IDLE:
        handle_handshake(message);
        break;
      case State::READY:
        handle_ready(message);
        break;
      case State::DOWNLOADING:
      case State::VERIFYING:
        handle_download_verdict(message);
        break;
      case State::UPLOADING:
        handle_uploading(message);
        break;
      default:
        throw unexpected(message);
    }
  } catch (const ProtocolError& e) {
    fail(e.kind(), e.detail());
  } catch (const store::StoreError& e) {
    fail(ErrorKind::WRITE_ERROR, e.what());
  }
}

void ServerProtocol::fail(ErrorKind kind, const std::string& message, bool notify_peer) {
  BOOST_LOG_TRIVIAL(error) << "ServerProtocol: " << kind << " in state " << state_.get_state()
                           << ": " << message;

  // Dropping the session discards any uncommitted upload
  session_.reset();
  awaiting_metadata_ = false;

  if (notify_peer) {
    send_error(kind, message);
  }

  // A rejected version proposal leaves the machine where it started
  if (kind == ErrorKind::VERSION_UNSUPPORTED &&
      (state_.get_state() == State::IDLE || state_.get_state() == State::HANDSHAKING)) {
    if (state_.get_state() == State::HANDSHAKING) {
      state_.transition_to(State::IDLE);
    }
  } else {
    state_.fail();
  }
  close_requested_ = true;
}


//==============================================
// HANDLERS PER STATE
//==============================================

void ServerProtocol::handle_handshake(const ProtocolMessage& message) {
  if (message.type != MessageType::HANDSHAKE) {
    throw unexpected(message);
  }
  transition(State::HANDSHAKING);

  std::string proposed = protocol::decode_version(message.payload);
  auto major = parse_major(proposed);
  if (!major || *major != protocol::ProtocolVersion::MAJOR) {
    BOOST_LOG_TRIVIAL(warning) << "ServerProtocol: Client proposed unsupported version '"
                               << proposed << "'";
    fail(ErrorKind::VERSION_UNSUPPORTED,
         "version " + proposed + " not supported, server speaks " +
         protocol::ProtocolVersion::to_string());
    return;
  }

  sink_.send(ProtocolMessage(MessageType::HANDSHAKE_ACK,
                             protocol::encode_version(protocol::ProtocolVersion::to_string())));
  transition(State::READY);
  BOOST_LOG_TRIVIAL(info) << "ServerProtocol: Handshake complete with client version " << proposed;
}

void ServerProtocol::handle_ready(const ProtocolMessage& message) {
  switch (message.type) {
    case MessageType::LIST_REQUEST: {
      std::vector<protocol::ListEntry> entries;
      for (const auto& info : store_.list()) {
        entries.push_back({info.name, static_cast<uint64_t>(info.size), info.modified_time});
      }
      sink_.send(ProtocolMessage(MessageType::LIST_RESPONSE,
                                 protocol::encode_list_response(entries)));
      BOOST_LOG_TRIVIAL(info) << "ServerProtocol: Listed " << entries.size() << " files";
      break;
    }
    case MessageType::FILE_REQUEST:
      handle_file_request(message);
      break;
    case MessageType::UPLOAD_START:
      transition(State::UPLOADING);
      awaiting_metadata_ = true;
      BOOST_LOG_TRIVIAL(info) << "ServerProtocol: Upload started, waiting for metadata";
      break;
    default:
      throw unexpected(message);
  }
}

void ServerProtocol::handle_file_request(const ProtocolMessage& message) {
  protocol::FileRequest request = protocol::decode_file_request(message.payload);
  transition(State::DOWNLOADING);

  BOOST_LOG_TRIVIAL(info) << "ServerProtocol: File request for '" << request.name
                          << "', chunk size " << request.chunk_size
                          << ", compression " << (request.compression ? "requested" : "off");

  if (!protocol::is_valid_filename(request.name)) {
    reject_request(ErrorKind::INVALID_FILENAME, "rejected filename '" + request.name + "'");
    return;
  }
  if (!is_allowed_chunk_size(request.chunk_size)) {
    reject_request(ErrorKind::INVALID_CHUNK_SIZE,
                   "chunk size " + std::to_string(request.chunk_size) + " is not an allowed size");
    return;
  }

  std::unique_ptr<std::ifstream> source;
  try {
    source = store_.open_for_read(request.name);
  } catch (const store::FileNotFoundError&) {
    reject_request(ErrorKind::FILE_NOT_FOUND, "no file named '" + request.name + "'");
    return;
  }

  bool compression = request.compression && config_.compression_enabled &&
                     config_.compression_level != integrity::CompressionLevel::NONE;
  protocol::FileMetadata metadata = describe_source(request.name, *source, request.chunk_size,
                                                    compression);
  session_ = TransferSession::for_sending(metadata, std::move(source), config_.compression_level);

  sink_.send(ProtocolMessage(MessageType::FILE_METADATA, protocol::encode_file_metadata(metadata)));
  stream_download();
}

void ServerProtocol::handle_download_verdict(const ProtocolMessage& message) {
  if (message.type != MessageType::CHUNK_ACK || state_.get_state() != State::VERIFYING) {
    throw unexpected(message);
  }

  uint32_t next_expected = protocol::decode_chunk_ack(message.payload);
  if (next_expected != session_->expected_chunks()) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "acknowledged " + std::to_string(next_expected) + " of " +
                        std::to_string(session_->expected_chunks()) + " chunks");
  }

  BOOST_LOG_TRIVIAL(info) << "ServerProtocol: Download of '" << session_->metadata().name
                          << "' verified by client (" << session_->bytes_transferred() << " bytes)";
  complete_session();
}

void ServerProtocol::handle_uploading(const ProtocolMessage& message) {
  if (awaiting_metadata_) {
    if (message.type != MessageType::FILE_METADATA) {
      throw unexpected(message);
    }
    begin_upload(message);
    return;
  }

  if (message.type != MessageType::FILE_CHUNK) {
    throw unexpected(message);
  }
  session_->receive_chunk(protocol::decode_chunk(message.payload));
  if (session_->all_chunks_transferred()) {
    finish_upload();
  }
}

void ServerProtocol::handle_peer_error(const ProtocolMessage& message) {
  protocol::ErrorPayload error = protocol::decode_error(message.payload);
  BOOST_LOG_TRIVIAL(error) << "ServerProtocol: Client reported " << error.kind << ": "
                           << error.message;
  // The peer already knows, nothing is sent back
  fail(error.kind, "reported by client: " + error.message, false);
}


//==============================================
// TRANSFER STEPS
//==============================================

void ServerProtocol::stream_download() {
  while (auto chunk_message = session_->next_chunk_message()) {
    sink_.send(*chunk_message);
  }
  transition(State::VERIFYING);

  BOOST_LOG_TRIVIAL(debug) << "ServerProtocol: Sent " << session_->chunks_transferred()
                           << " chunks of '" << session_->metadata().name
                           << "', waiting for verification";
}

void ServerProtocol::begin_upload(const ProtocolMessage& message) {
  protocol::FileMetadata metadata = protocol::decode_file_metadata(message.payload);
  validate_metadata(metadata);

  session_ = TransferSession::for_receiving(metadata, store_.open_for_write_temp());
  awaiting_metadata_ = false;

  BOOST_LOG_TRIVIAL(info) << "ServerProtocol: Receiving '" << metadata.name << "', "
                          << metadata.total_size << " bytes in " << metadata.chunk_count()
                          << " chunks of " << metadata.chunk_size;

  if (session_->all_chunks_transferred()) {
    finish_upload();
  }
}

void ServerProtocol::finish_upload() {
  transition(State::VERIFYING);

  if (!session_->verify()) {
    session_->temp_file().discard();
    throw ProtocolError(ErrorKind::CHECKSUM_MISMATCH,
                        "digest of '" + session_->metadata().name + "' does not match");
  }

  store_.commit(session_->temp_file(), session_->metadata().name);
  sink_.send(ProtocolMessage(MessageType::UPLOAD_COMPLETE,
                             protocol::encode_upload_complete(*session_->computed_digest())));

  BOOST_LOG_TRIVIAL(info) << "ServerProtocol: Upload of '" << session_->metadata().name
                          << "' committed (" << session_->bytes_transferred() << " bytes)";
  complete_session();
}

void ServerProtocol::complete_session() {
  transition(State::COMPLETE);
  session_.reset();
  transition(State::READY);
}

void ServerProtocol::reject_request(ErrorKind kind, const std::string& message) {
  BOOST_LOG_TRIVIAL(warning) << "ServerProtocol: Rejected request, " << kind << ": " << message;
  send_error(kind, message);
  session_.reset();
  transition(State::READY);
}


//==============================================
// UTILITY METHODS
//==============================================

void ServerProtocol::transition(State next) {
  State current = state_.get_state();
  if (!state_.transition_to(next)) {
    throw ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                        "invalid transition " + TransferState::state_to_string(current) +
                        " -> " + TransferState::state_to_string(next));
  }
  BOOST_LOG_TRIVIAL(trace) << "ServerProtocol: " << current << " -> " << next;
}

ProtocolError ServerProtocol::unexpected(const ProtocolMessage& message) const {
  return ProtocolError(ErrorKind::PROTOCOL_VIOLATION,
                       std::string("unexpected ") + protocol::message_type_to_string(message.type) +
                       " in state " + state_.get_state_string());
}

void ServerProtocol::send_error(ErrorKind kind, const std::string& message) {
  try {
    sink_.send(protocol::make_error_message(kind, message));
  } catch (const ProtocolError& e) {
    // The connection is going away, the original failure is what gets reported
    BOOST_LOG_TRIVIAL(warning) << "ServerProtocol: Could not deliver ERROR to client: " << e.what();
  }
}

} // namespace transfer
} // namespace lbft
