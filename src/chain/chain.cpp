#include "chainvault/chain/chain.hpp"
#include "chainvault/chain/chain_error.hpp"
#include "chainvault/crypto/hasher.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace chainvault {
namespace chain {

//==============================================
// HASHING
//==============================================

std::string Chain::compute_hash(const Block& block) {
  crypto::Sha256Hasher hasher;
  hasher.update_u64(block.index)
        .update_u64(block.sequence)
        .update_u64(block.total_blocks)
        .update_string(block.file_hash)
        .update_string(block.filename)
        .update_string(block.prev_hash);

  // Length prefix keeps payload boundaries unambiguous
  hasher.update_u64(block.payload.size());
  hasher.update(block.payload);
  return hasher.hex_digest();
}

Block Chain::make_block(uint64_t index, const std::string& prev_hash, const Payload& payload,
                        const std::string& file_hash, uint64_t sequence, uint64_t total_blocks,
                        const std::string& filename) {
  Block block;
  block.index = index;
  block.payload = payload;
  block.file_hash = file_hash;
  block.sequence = sequence;
  block.total_blocks = total_blocks;
  block.filename = filename;
  block.prev_hash = prev_hash;
  block.hash = compute_hash(block);
  return block;
}

//==============================================
// MUTATION
//==============================================

Block Chain::append(const Payload& payload, const std::string& file_hash, uint64_t sequence,
                    uint64_t total_blocks, const std::string& filename) {
  Block block = make_block(size(), tail_hash(), payload, file_hash, sequence, total_blocks, filename);
  blocks_.push_back(block);
  BOOST_LOG_TRIVIAL(debug) << "Chain: Appended block " << block.index << " (" << block.payload.size() 
                           << " bytes) hash " << block.hash;
  return block;
}

std::vector<Block> Chain::stage(const std::vector<Payload>& payloads, const std::string& file_hash,
                                const std::string& filename) const {
  if (payloads.empty()) {
    throw ShapeError("Cannot stage an empty block sequence");
  }

  std::vector<Block> staged;
  staged.reserve(payloads.size());

  uint64_t index = size();
  std::string prev_hash = tail_hash();
  for (uint64_t sequence = 0; sequence < payloads.size(); ++sequence) {
    staged.push_back(make_block(index + sequence, prev_hash, payloads[sequence], file_hash,
                                sequence, payloads.size(), filename));
    prev_hash = staged.back().hash;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chain: Staged " << staged.size() << " block(s) for file " << file_hash 
                           << " starting at index " << index;
  return staged;
}

void Chain::commit(const std::vector<Block>& staged) {
  // Validate the whole run before touching the chain
  uint64_t index = size();
  std::string prev_hash = tail_hash();
  for (const auto& block : staged) {
    if (!links_to(block, index, prev_hash)) {
      BOOST_LOG_TRIVIAL(error) << "Chain: Staged block " << block.index << " does not link to index " << index;
      throw ShapeError("Staged block does not link to the chain tail at index " + std::to_string(index));
    }
    prev_hash = block.hash;
    ++index;
  }

  blocks_.insert(blocks_.end(), staged.begin(), staged.end());
  BOOST_LOG_TRIVIAL(debug) << "Chain: Committed " << staged.size() << " block(s), chain length " << size();
}

void Chain::restore(std::vector<Block> blocks) {
  if (!blocks_.empty()) {
    throw ShapeError("Cannot restore into a non-empty chain");
  }
  blocks_ = std::move(blocks);
  BOOST_LOG_TRIVIAL(info) << "Chain: Restored " << blocks_.size() << " block(s)";
}

bool Chain::links_to(const Block& block, uint64_t index, const std::string& prev_hash) {
  return block.index == index
    && block.prev_hash == prev_hash
    && block.hash == compute_hash(block);
}

//==============================================
// INTEGRITY
//==============================================

VerifyResult Chain::verify() const {
  VerifyResult result;

  const std::string* expected_prev = &genesis_hash();
  for (uint64_t i = 0; i < blocks_.size(); ++i) {
    const Block& block = blocks_[i];
    if (!links_to(block, i, *expected_prev)) {
      BOOST_LOG_TRIVIAL(warning) << "Chain: Verification failed at index " << i;
      result.ok = false;
      result.first_broken_index = i;
      return result;
    }
    expected_prev = &block.hash;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chain: Verified " << blocks_.size() << " block(s)";
  return result;
}

//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<Block> Chain::blocks_for_file(const std::string& file_hash) const {
  std::vector<Block> matches;
  std::copy_if(blocks_.begin(), blocks_.end(), std::back_inserter(matches),
    [&file_hash](const Block& block) { return block.file_hash == file_hash; });

  if (matches.empty()) {
    throw NotFoundError(file_hash);
  }

  std::stable_sort(matches.begin(), matches.end(),
    [](const Block& lhs, const Block& rhs) { return lhs.sequence < rhs.sequence; });
  return matches;
}

const Block& Chain::at(uint64_t index) const {
  if (index >= blocks_.size()) {
    throw std::out_of_range("Chain: Index " + std::to_string(index) + " out of range");
  }
  return blocks_[index];
}

const std::string& Chain::tail_hash() const {
  if (blocks_.empty()) {
    return genesis_hash();
  }
  return blocks_.back().hash;
}

} // namespace chain
} // namespace chainvault
