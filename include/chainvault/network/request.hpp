#ifndef CHAINVAULT_NETWORK_REQUEST_HPP
#define CHAINVAULT_NETWORK_REQUEST_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "chainvault/chain/chunker.hpp"
#include "chainvault/network/message_frame.hpp"

namespace chainvault {
namespace network {

// Parsed command handed from a session to the dispatcher
struct Request {
  MessageType command = MessageType::CHECK;
  // File hash for ADD, looked up hash for CHECK and GET
  std::string hash;
  std::string filename;
  uint64_t total_blocks = 0;
  std::vector<chain::Payload> payloads;
};

struct Response {
  Status status = Status::OK;
  // Block count, chain length or first broken index depending on the command
  uint64_t value = 0;
  std::string message;
  std::string filename;
  // Payloads streamed after the header of a GET response
  std::vector<chain::Payload> blocks;
};

// Header fields of an ADD request
struct AddHeader {
  std::string file_hash;
  std::string filename;
  uint64_t total_blocks = 0;
};

// ---- FRAME CONSTRUCTION ----
MessageFrame make_add_frame(const AddHeader& header);
// CHECK or GET carrying one hash
MessageFrame make_query_frame(MessageType type, const std::string& hash);
MessageFrame make_block_frame(const chain::Payload& payload);
// Header frame only, blocks are sent separately
MessageFrame make_response_frame(const Response& response);


// ---- FRAME PARSING ----
// Each throws MalformedRequest if the payload does not decode exactly
AddHeader parse_add_frame(const MessageFrame& frame);
std::string parse_query_frame(const MessageFrame& frame);
Response parse_response_frame(const MessageFrame& frame);

} // namespace network
} // namespace chainvault

#endif // CHAINVAULT_NETWORK_REQUEST_HPP
