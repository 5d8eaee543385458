#ifndef LBFT_TRANSFER_STATE_HPP
#define LBFT_TRANSFER_STATE_HPP

#include <ostream>
#include <string>

namespace lbft {
namespace transfer {

/**
 * TransferState tracks the connection-level protocol state on either side of a connection.
 * Implements a state machine that enforces valid state transitions and prevents invalid ones.
 */
class TransferState {
public:
    /**
     * Protocol states:
     * IDLE        - Connection open, no handshake yet
     * HANDSHAKING - Version proposal sent or received
     * READY       - Handshake done, waiting for a request
     * DOWNLOADING - Server to client file stream in progress
     * UPLOADING   - Client to server file stream in progress
     * VERIFYING   - Last chunk consumed, whole-file digest being checked
     * COMPLETE    - Transfer verified, can start a new session from READY
     * FAILED      - Fatal error, the connection is closed
     */
    enum class State {
        IDLE,
        HANDSHAKING,
        READY,
        DOWNLOADING,
        UPLOADING,
        VERIFYING,
        COMPLETE,
        FAILED
    };

    TransferState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    /**
     * Check if the current state ends a transfer session (COMPLETE or FAILED).
     * @return true if in terminal state
     */
    bool is_terminal() const {
        return current_state_ == State::COMPLETE ||
               current_state_ == State::FAILED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    // Forces FAILED from any state, used on I/O errors and protocol violations
    void fail() {
        current_state_ = State::FAILED;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::IDLE:
                return to == State::HANDSHAKING ||
                       to == State::FAILED;

            case State::HANDSHAKING:
                return to == State::READY ||
                       to == State::IDLE ||
                       to == State::FAILED;

            case State::READY:
                return to == State::DOWNLOADING ||
                       to == State::UPLOADING ||
                       to == State::FAILED;

            // A rejected file request returns to READY
            case State::DOWNLOADING:
                return to == State::VERIFYING ||
                       to == State::READY ||
                       to == State::FAILED;

            case State::UPLOADING:
                return to == State::VERIFYING ||
                       to == State::FAILED;

            case State::VERIFYING:
                return to == State::COMPLETE ||
                       to == State::FAILED;

            case State::COMPLETE:
                return to == State::READY;

            case State::FAILED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:        return "IDLE";
            case State::HANDSHAKING: return "HANDSHAKING";
            case State::READY:       return "READY";
            case State::DOWNLOADING: return "DOWNLOADING";
            case State::UPLOADING:   return "UPLOADING";
            case State::VERIFYING:   return "VERIFYING";
            case State::COMPLETE:    return "COMPLETE";
            case State::FAILED:      return "FAILED";
            default:                 return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for TransferState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const TransferState::State& state) {
    os << TransferState::state_to_string(state);
    return os;
}

} // namespace transfer
} // namespace lbft

#endif // LBFT_TRANSFER_STATE_HPP
