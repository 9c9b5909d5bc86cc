#ifndef CHAINVAULT_NETWORK_CODEC_HPP
#define CHAINVAULT_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <boost/endian/conversion.hpp>
#include "chainvault/network/message_frame.hpp"

namespace chainvault {
namespace network {

// Frame layout:
// magic u8 | version u8 | type u8 | status u8 | payload size u64 | payload
class Codec {
public:
  static constexpr uint8_t MAGIC = 0xC7;
  static constexpr uint8_t VERSION = 1;
  static constexpr std::size_t HEADER_SIZE = 12;
  static constexpr uint64_t MAX_PAYLOAD_SIZE = 64ULL * 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Codec(uint64_t max_payload_size = MAX_PAYLOAD_SIZE);

  
  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a message frame to an output stream, returns bytes written
  std::size_t serialize(const MessageFrame& frame, std::ostream& output);
  // Reads one frame. Throws MalformedRequest (frame level) for a bad header
  // and ConnectionError when the stream fails.
  MessageFrame deserialize(std::istream& input);

  uint64_t max_payload_size() const { return max_payload_size_; }

private:
  // ---- PARAMETERS ----
  uint64_t max_payload_size_;

  
  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  void read_bytes(std::istream& input, void* data, std::size_t size);

  
  // ---- BYTE ORDER CONVERSION ----
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace chainvault

#endif // CHAINVAULT_NETWORK_CODEC_HPP
