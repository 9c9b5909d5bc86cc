#ifndef CHAINVAULT_CHAIN_CHUNKER_HPP
#define CHAINVAULT_CHAIN_CHUNKER_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

namespace chainvault {
namespace chain {

using Payload = std::vector<uint8_t>;

class Chunker {
public:
  static constexpr size_t DEFAULT_BLOCK_SIZE = 500;

  // ---- CONSTRUCTOR ----
  explicit Chunker(size_t block_size = DEFAULT_BLOCK_SIZE);


  // ---- SPLITTING ----
  // Splits bytes into block_size chunks, the last one possibly shorter.
  // Empty input yields a single empty chunk.
  std::vector<Payload> split(const std::vector<uint8_t>& bytes) const;
  // Reads the stream to its end in block_size chunks
  std::vector<Payload> split(std::istream& input) const;


  // ---- REASSEMBLY ----
  // Concatenates payloads in order, throws ShapeError if there are none
  static std::vector<uint8_t> reassemble(const std::vector<Payload>& payloads);
  // Writes the concatenation to output and returns the number of bytes written
  static size_t reassemble(const std::vector<Payload>& payloads, std::ostream& output);


  // ---- GETTERS ----
  size_t block_size() const { return block_size_; }

private:
  // ---- PARAMETERS ----
  size_t block_size_;
};

} // namespace chain
} // namespace chainvault

#endif // CHAINVAULT_CHAIN_CHUNKER_HPP
