#ifndef CHAINVAULT_CHAIN_BLOCK_HPP
#define CHAINVAULT_CHAIN_BLOCK_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace chainvault {
namespace chain {

// prev_hash of the genesis block
const std::string& genesis_hash();

// One chain entry: a payload chunk plus linkage and identity hashes
struct Block {
  uint64_t index = 0;
  std::vector<uint8_t> payload;
  std::string file_hash;
  uint64_t sequence = 0;
  uint64_t total_blocks = 0;
  std::string filename;
  std::string prev_hash;
  std::string hash;

  bool is_genesis() const { return index == 0; }
};

bool operator==(const Block& lhs, const Block& rhs);
bool operator!=(const Block& lhs, const Block& rhs);

} // namespace chain
} // namespace chainvault

#endif // CHAINVAULT_CHAIN_BLOCK_HPP
