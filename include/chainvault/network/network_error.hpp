#ifndef CHAINVAULT_NETWORK_ERROR_HPP
#define CHAINVAULT_NETWORK_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chainvault {
namespace network {

// Outcome carried in the status byte of every frame
enum class Status : uint8_t {
    OK = 0,
    NOT_FOUND = 1,
    CORRUPT = 2,
    ERROR = 3
};

inline const char* status_to_string(Status status) {
    switch (status) {
        case Status::OK: return "OK";
        case Status::NOT_FOUND: return "NOT_FOUND";
        case Status::CORRUPT: return "CORRUPT";
        case Status::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

// Request could not be decoded. Frame-level errors also poison the stream.
class MalformedRequest : public ProtocolError {
public:
    explicit MalformedRequest(const std::string& message, bool frame_level = false) 
        : ProtocolError("Malformed request: " + message)
        , frame_level_(frame_level) {}

    bool frame_level() const { return frame_level_; }

private:
    bool frame_level_;
};

// Transport failure: connect, read, write or timeout
class ConnectionError : public ProtocolError {
public:
    explicit ConnectionError(const std::string& message) : ProtocolError("Connection error: " + message) {}
};

} // namespace network
} // namespace chainvault

#endif // CHAINVAULT_NETWORK_ERROR_HPP
