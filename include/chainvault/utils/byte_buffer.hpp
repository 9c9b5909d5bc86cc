#ifndef CHAINVAULT_UTILS_BYTE_BUFFER_HPP
#define CHAINVAULT_UTILS_BYTE_BUFFER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace chainvault {
namespace utils {

class BufferUnderflow : public std::runtime_error {
public:
  explicit BufferUnderflow(const std::string& message) : std::runtime_error(message) {}
};

// Appends big endian integers and length-prefixed fields to a byte vector
class ByteWriter {
public:
  void put_u8(uint8_t value);
  void put_u32(uint32_t value);
  void put_u64(uint64_t value);
  // u32 length prefix followed by the characters
  void put_string(const std::string& value);
  // u64 length prefix followed by the bytes
  void put_bytes(const std::vector<uint8_t>& value);
  void put_raw(const void* data, size_t size);

  const std::vector<uint8_t>& data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

// Reads fields written by ByteWriter, throwing BufferUnderflow past the end
class ByteReader {
public:
  explicit ByteReader(const std::vector<uint8_t>& data) : data_(data) {}

  uint8_t get_u8();
  uint32_t get_u32();
  uint64_t get_u64();
  std::string get_string(size_t max_length);
  std::vector<uint8_t> get_bytes(size_t max_length);
  void get_raw(void* data, size_t size);

  size_t remaining() const { return data_.size() - offset_; }
  bool exhausted() const { return offset_ == data_.size(); }

private:
  const std::vector<uint8_t>& data_;
  size_t offset_ = 0;

  void require(size_t size) const;
};

} // namespace utils
} // namespace chainvault

#endif // CHAINVAULT_UTILS_BYTE_BUFFER_HPP
