#ifndef CHAINVAULT_STORE_BLOCK_RECORD_HPP
#define CHAINVAULT_STORE_BLOCK_RECORD_HPP

#include <cstdint>
#include <vector>
#include "chainvault/chain/block.hpp"

namespace chainvault {
namespace store {

// Binary on-disk form of a block:
// magic "CVBK" | version u8 | index u64 | sequence u64 | total_blocks u64 |
// file_hash | filename | prev_hash | hash (u32 length-prefixed) | payload (u64 length-prefixed)
class BlockRecord {
public:
  static constexpr uint8_t VERSION = 1;
  static constexpr size_t MAX_STRING_LENGTH = 4096;
  static constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;

  static std::vector<uint8_t> encode(const chain::Block& block);
  // Throws RecordFormatError on bad magic, version, or truncation
  static chain::Block decode(const std::vector<uint8_t>& record);
};

} // namespace store
} // namespace chainvault

#endif // CHAINVAULT_STORE_BLOCK_RECORD_HPP
