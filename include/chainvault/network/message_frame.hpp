#ifndef CHAINVAULT_NETWORK_MESSAGE_FRAME_HPP
#define CHAINVAULT_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <vector>
#include "chainvault/network/network_error.hpp"

namespace chainvault {
namespace network {

// Message type used to differentiate between requests
enum class MessageType : uint8_t {
    ADD = 1,
    CHECK = 2,
    GET = 3,
    BLOCK = 4,
    RESPONSE = 5
};

inline const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::ADD: return "ADD";
        case MessageType::CHECK: return "CHECK";
        case MessageType::GET: return "GET";
        case MessageType::BLOCK: return "BLOCK";
        case MessageType::RESPONSE: return "RESPONSE";
        default: return "UNKNOWN";
    }
}

inline bool is_valid_message_type(uint8_t value) {
    return value >= static_cast<uint8_t>(MessageType::ADD) && 
           value <= static_cast<uint8_t>(MessageType::RESPONSE);
}

// Data structure used to represent one frame locally
struct MessageFrame {
    MessageType message_type = MessageType::RESPONSE;
    Status status = Status::OK;
    std::vector<uint8_t> payload;
};

} // namespace network
} // namespace chainvault

#endif // CHAINVAULT_NETWORK_MESSAGE_FRAME_HPP
