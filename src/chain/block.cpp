#include "chainvault/chain/block.hpp"
#include "chainvault/crypto/hasher.hpp"

namespace chainvault {
namespace chain {

const std::string& genesis_hash() {
  static const std::string sentinel(crypto::Sha256Hasher::HEX_SIZE, '0');
  return sentinel;
}

bool operator==(const Block& lhs, const Block& rhs) {
  return lhs.index == rhs.index
    && lhs.sequence == rhs.sequence
    && lhs.total_blocks == rhs.total_blocks
    && lhs.file_hash == rhs.file_hash
    && lhs.filename == rhs.filename
    && lhs.prev_hash == rhs.prev_hash
    && lhs.hash == rhs.hash
    && lhs.payload == rhs.payload;
}

bool operator!=(const Block& lhs, const Block& rhs) {
  return !(lhs == rhs);
}

} // namespace chain
} // namespace chainvault
