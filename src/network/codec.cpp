#include "chainvault/network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <string>

namespace chainvault {
namespace network {

Codec::Codec(uint64_t max_payload_size) 
  : max_payload_size_(max_payload_size) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Initializing Codec with frame limit of " << max_payload_size_ << " bytes";
}

std::size_t Codec::serialize(const MessageFrame& frame, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw ConnectionError("Codec: Invalid output stream");
  }
  if (frame.payload.size() > max_payload_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Refusing to send payload of " << frame.payload.size() << " bytes";
    throw ProtocolError("Codec: Payload exceeds frame limit");
  }

  std::size_t total_bytes = 0;

  // Write fixed header bytes
  uint8_t header[4] = {
    MAGIC,
    VERSION,
    static_cast<uint8_t>(frame.message_type),
    static_cast<uint8_t>(frame.status)
  };
  BOOST_LOG_TRIVIAL(debug) << "Codec: Writing " << message_type_to_string(frame.message_type) 
                           << " frame with status " << status_to_string(frame.status);
  write_bytes(output, header, sizeof(header));
  total_bytes += sizeof(header);

  // Write payload size in network byte order
  uint64_t network_payload_size = to_network_order(static_cast<uint64_t>(frame.payload.size()));
  write_bytes(output, &network_payload_size, sizeof(network_payload_size));
  total_bytes += sizeof(network_payload_size);

  if (!frame.payload.empty()) {
    write_bytes(output, frame.payload.data(), frame.payload.size());
    total_bytes += frame.payload.size();
  }

  if (!output.flush()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to flush output stream";
    throw ConnectionError("Codec: Failed to flush output stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Codec: Message frame serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}

MessageFrame Codec::deserialize(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw ConnectionError("Codec: Invalid input stream");
  }

  MessageFrame frame;

  uint8_t header[4];
  read_bytes(input, header, sizeof(header));

  if (header[0] != MAGIC) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Bad frame magic " << static_cast<int>(header[0]);
    throw MalformedRequest("bad frame magic", true);
  }
  if (header[1] != VERSION) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Unsupported frame version " << static_cast<int>(header[1]);
    throw MalformedRequest("unsupported frame version " + std::to_string(header[1]), true);
  }
  if (!is_valid_message_type(header[2])) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Unknown message type " << static_cast<int>(header[2]);
    throw MalformedRequest("unknown message type " + std::to_string(header[2]), true);
  }
  if (header[3] > static_cast<uint8_t>(Status::ERROR)) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Unknown status " << static_cast<int>(header[3]);
    throw MalformedRequest("unknown status " + std::to_string(header[3]), true);
  }
  frame.message_type = static_cast<MessageType>(header[2]);
  frame.status = static_cast<Status>(header[3]);

  // Read payload size
  uint64_t network_payload_size;
  read_bytes(input, &network_payload_size, sizeof(network_payload_size));
  uint64_t payload_size = from_network_order(network_payload_size);
  if (payload_size > max_payload_size_) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Frame payload of " << payload_size << " bytes exceeds limit";
    throw MalformedRequest("frame of " + std::to_string(payload_size) + " bytes exceeds limit", true);
  }

  frame.payload.resize(static_cast<std::size_t>(payload_size));
  if (payload_size > 0) {
    read_bytes(input, frame.payload.data(), frame.payload.size());
  }

  BOOST_LOG_TRIVIAL(debug) << "Codec: Read " << message_type_to_string(frame.message_type) 
                           << " frame with " << payload_size << " payload bytes";
  return frame;
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw ConnectionError("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Failed to read " << size << " bytes from input stream";
    throw ConnectionError("Codec: Failed to read from input stream");
  }
}

} // namespace network
} // namespace chainvault
