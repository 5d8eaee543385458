#ifndef LBFT_TRANSFER_MESSAGE_SINK_HPP
#define LBFT_TRANSFER_MESSAGE_SINK_HPP

#include <optional>
#include "protocol/message.hpp"

namespace lbft {
namespace transfer {

// Destination for messages emitted by the state machine
class MessageSink {
public:
  virtual ~MessageSink() = default;
  virtual void send(const protocol::ProtocolMessage& message) = 0;
};

// Bidirectional message transport, implemented over a socket by network::Connection
class MessageStream : public MessageSink {
public:
  // Next complete message, nullopt when the peer closed cleanly between frames
  virtual std::optional<protocol::ProtocolMessage> receive() = 0;
  virtual void close() = 0;
};

} // namespace transfer
} // namespace lbft

#endif // LBFT_TRANSFER_MESSAGE_SINK_HPP
