#include "chainvault/network/request.hpp"
#include "chainvault/network/network_error.hpp"
#include "chainvault/utils/byte_buffer.hpp"

namespace chainvault {
namespace network {

namespace {

constexpr size_t MAX_FIELD_LENGTH = 4096;

void require_type(const MessageFrame& frame, MessageType expected) {
  if (frame.message_type != expected) {
    throw MalformedRequest(std::string("expected ") + message_type_to_string(expected) + " frame, got " 
                           + message_type_to_string(frame.message_type));
  }
}

void require_exhausted(const utils::ByteReader& reader) {
  if (!reader.exhausted()) {
    throw MalformedRequest(std::to_string(reader.remaining()) + " trailing byte(s) in payload");
  }
}

} // namespace

//==============================================
// FRAME CONSTRUCTION
//==============================================

MessageFrame make_add_frame(const AddHeader& header) {
  utils::ByteWriter writer;
  writer.put_string(header.file_hash);
  writer.put_string(header.filename);
  writer.put_u64(header.total_blocks);

  MessageFrame frame;
  frame.message_type = MessageType::ADD;
  frame.payload = writer.release();
  return frame;
}

MessageFrame make_query_frame(MessageType type, const std::string& hash) {
  utils::ByteWriter writer;
  writer.put_string(hash);

  MessageFrame frame;
  frame.message_type = type;
  frame.payload = writer.release();
  return frame;
}

MessageFrame make_block_frame(const chain::Payload& payload) {
  MessageFrame frame;
  frame.message_type = MessageType::BLOCK;
  frame.payload = payload;
  return frame;
}

MessageFrame make_response_frame(const Response& response) {
  utils::ByteWriter writer;
  writer.put_u64(response.value);
  writer.put_string(response.message);
  writer.put_string(response.filename);

  MessageFrame frame;
  frame.message_type = MessageType::RESPONSE;
  frame.status = response.status;
  frame.payload = writer.release();
  return frame;
}

//==============================================
// FRAME PARSING
//==============================================

AddHeader parse_add_frame(const MessageFrame& frame) {
  require_type(frame, MessageType::ADD);
  try {
    utils::ByteReader reader(frame.payload);
    AddHeader header;
    header.file_hash = reader.get_string(MAX_FIELD_LENGTH);
    header.filename = reader.get_string(MAX_FIELD_LENGTH);
    header.total_blocks = reader.get_u64();
    require_exhausted(reader);
    return header;
  }
  catch (const utils::BufferUnderflow& e) {
    throw MalformedRequest(std::string("ADD header: ") + e.what());
  }
}

std::string parse_query_frame(const MessageFrame& frame) {
  if (frame.message_type != MessageType::CHECK && frame.message_type != MessageType::GET) {
    throw MalformedRequest(std::string("expected CHECK or GET frame, got ") 
                           + message_type_to_string(frame.message_type));
  }
  try {
    utils::ByteReader reader(frame.payload);
    std::string hash = reader.get_string(MAX_FIELD_LENGTH);
    require_exhausted(reader);
    return hash;
  }
  catch (const utils::BufferUnderflow& e) {
    throw MalformedRequest(std::string("query: ") + e.what());
  }
}

Response parse_response_frame(const MessageFrame& frame) {
  require_type(frame, MessageType::RESPONSE);
  try {
    utils::ByteReader reader(frame.payload);
    Response response;
    response.status = frame.status;
    response.value = reader.get_u64();
    response.message = reader.get_string(MAX_FIELD_LENGTH);
    response.filename = reader.get_string(MAX_FIELD_LENGTH);
    require_exhausted(reader);
    return response;
  }
  catch (const utils::BufferUnderflow& e) {
    throw MalformedRequest(std::string("response: ") + e.what());
  }
}

} // namespace network
} // namespace chainvault
