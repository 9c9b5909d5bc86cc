#include "chainvault/chain/chunker.hpp"
#include "chainvault/chain/chain_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>

namespace chainvault {
namespace chain {

Chunker::Chunker(size_t block_size) : block_size_(block_size) {
  if (block_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Block size must be positive";
    throw std::invalid_argument("Chunker: Block size must be positive");
  }
}

//==============================================
// SPLITTING
//==============================================

std::vector<Payload> Chunker::split(const std::vector<uint8_t>& bytes) const {
  std::vector<Payload> payloads;
  payloads.reserve(bytes.size() / block_size_ + 1);

  for (size_t offset = 0; offset < bytes.size(); offset += block_size_) {
    size_t length = std::min(block_size_, bytes.size() - offset);
    payloads.emplace_back(bytes.begin() + offset, bytes.begin() + offset + length);
  }

  if (payloads.empty()) {
    payloads.emplace_back();
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << bytes.size() << " bytes into " 
                           << payloads.size() << " block(s) of up to " << block_size_ << " bytes";
  return payloads;
}

std::vector<Payload> Chunker::split(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Invalid input stream";
    throw std::runtime_error("Chunker: Invalid input stream");
  }

  std::vector<Payload> payloads;
  size_t total_bytes = 0;
  Payload buffer(block_size_);

  // Read input stream in chunks, keeping the final partial chunk if present
  while (input.read(reinterpret_cast<char*>(buffer.data()), block_size_) || input.gcount() > 0) {
    size_t bytes_read = static_cast<size_t>(input.gcount());
    payloads.emplace_back(buffer.begin(), buffer.begin() + bytes_read);
    total_bytes += bytes_read;
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Stream error after " << total_bytes << " bytes";
    throw std::runtime_error("Chunker: Failed to read input stream");
  }

  if (payloads.empty()) {
    payloads.emplace_back();
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split stream of " << total_bytes << " bytes into " 
                           << payloads.size() << " block(s)";
  return payloads;
}

//==============================================
// REASSEMBLY
//==============================================

std::vector<uint8_t> Chunker::reassemble(const std::vector<Payload>& payloads) {
  if (payloads.empty()) {
    throw ShapeError("Cannot reassemble an empty block sequence");
  }

  size_t total_size = 0;
  for (const auto& payload : payloads) {
    total_size += payload.size();
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(total_size);
  for (const auto& payload : payloads) {
    bytes.insert(bytes.end(), payload.begin(), payload.end());
  }
  return bytes;
}

size_t Chunker::reassemble(const std::vector<Payload>& payloads, std::ostream& output) {
  if (payloads.empty()) {
    throw ShapeError("Cannot reassemble an empty block sequence");
  }

  size_t total_bytes = 0;
  for (const auto& payload : payloads) {
    if (!output.write(reinterpret_cast<const char*>(payload.data()), payload.size())) {
      BOOST_LOG_TRIVIAL(error) << "Chunker: Failed to write " << payload.size() << " bytes to output stream";
      throw std::runtime_error("Chunker: Failed to write to output stream");
    }
    total_bytes += payload.size();
  }

  output.flush();
  return total_bytes;
}

} // namespace chain
} // namespace chainvault
