#ifndef CHAINVAULT_SESSION_STATE_HPP
#define CHAINVAULT_SESSION_STATE_HPP

#include <ostream>
#include <string>

namespace chainvault {
namespace network {

/**
 * SessionState tracks which command a connection is serving.
 * Enforces valid transitions of the per-connection command state machine.
 */
class SessionState {
public:
    /**
     * Session states:
     * AWAITING_COMMAND - Idle, the next frame must start a command
     * ADDING           - Receiving the BLOCK frames of an ADD
     * CHECKING         - Answering a CHECK
     * GETTING          - Streaming the blocks of a GET
     * CLOSED           - Connection finished, no further transitions
     */
    enum class State {
        AWAITING_COMMAND,
        ADDING,
        CHECKING,
        GETTING,
        CLOSED
    };

    SessionState() : current_state_(State::AWAITING_COMMAND) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::CLOSED;
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

    // Check if a transition is valid
    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::AWAITING_COMMAND:
                return to == State::ADDING ||
                       to == State::CHECKING ||
                       to == State::GETTING ||
                       to == State::CLOSED;

            case State::ADDING:
            case State::CHECKING:
            case State::GETTING:
                return to == State::AWAITING_COMMAND ||
                       to == State::CLOSED;

            case State::CLOSED:
                return false;
        }
        return false;
    }

    // Convert state to string for logging
    static std::string state_to_string(State state) {
        switch (state) {
            case State::AWAITING_COMMAND: return "AWAITING_COMMAND";
            case State::ADDING:           return "ADDING";
            case State::CHECKING:         return "CHECKING";
            case State::GETTING:          return "GETTING";
            case State::CLOSED:           return "CLOSED";
            default:                      return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for SessionState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const SessionState::State& state) {
    os << SessionState::state_to_string(state);
    return os;
}

} // namespace network
} // namespace chainvault

#endif // CHAINVAULT_SESSION_STATE_HPP
