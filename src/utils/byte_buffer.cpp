#include "chainvault/utils/byte_buffer.hpp"
#include <boost/endian/conversion.hpp>
#include <cstring>

namespace chainvault {
namespace utils {

//==============================================
// WRITER
//==============================================

void ByteWriter::put_u8(uint8_t value) {
  buffer_.push_back(value);
}

void ByteWriter::put_u32(uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  put_raw(&network_value, sizeof(network_value));
}

void ByteWriter::put_u64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  put_raw(&network_value, sizeof(network_value));
}

void ByteWriter::put_string(const std::string& value) {
  put_u32(static_cast<uint32_t>(value.size()));
  put_raw(value.data(), value.size());
}

void ByteWriter::put_bytes(const std::vector<uint8_t>& value) {
  put_u64(value.size());
  put_raw(value.data(), value.size());
}

void ByteWriter::put_raw(const void* data, size_t size) {
  const uint8_t* bytes = static_cast<const uint8_t*>(data);
  buffer_.insert(buffer_.end(), bytes, bytes + size);
}

//==============================================
// READER
//==============================================

void ByteReader::require(size_t size) const {
  if (size > remaining()) {
    throw BufferUnderflow("Byte reader: Needed " + std::to_string(size) + " bytes but only " 
                          + std::to_string(remaining()) + " remain");
  }
}

uint8_t ByteReader::get_u8() {
  require(1);
  return data_[offset_++];
}

uint32_t ByteReader::get_u32() {
  uint32_t network_value;
  get_raw(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t ByteReader::get_u64() {
  uint64_t network_value;
  get_raw(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

std::string ByteReader::get_string(size_t max_length) {
  uint32_t length = get_u32();
  if (length > max_length) {
    throw BufferUnderflow("Byte reader: String length " + std::to_string(length) 
                          + " exceeds limit " + std::to_string(max_length));
  }
  require(length);
  std::string value(reinterpret_cast<const char*>(data_.data() + offset_), length);
  offset_ += length;
  return value;
}

std::vector<uint8_t> ByteReader::get_bytes(size_t max_length) {
  uint64_t length = get_u64();
  if (length > max_length) {
    throw BufferUnderflow("Byte reader: Byte field length " + std::to_string(length) 
                          + " exceeds limit " + std::to_string(max_length));
  }
  require(length);
  std::vector<uint8_t> value(data_.begin() + offset_, data_.begin() + offset_ + length);
  offset_ += length;
  return value;
}

void ByteReader::get_raw(void* data, size_t size) {
  require(size);
  if (size > 0) {
    std::memcpy(data, data_.data() + offset_, size);
  }
  offset_ += size;
}

} // namespace utils
} // namespace chainvault
