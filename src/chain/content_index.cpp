#include "chainvault/chain/content_index.hpp"
#include <boost/log/trivial.hpp>

namespace chainvault {
namespace chain {

void ContentIndex::record(const Block& block) {
  // Damaged records restored from disk carry no hashes
  if (!block.hash.empty()) {
    blocks_[block.hash] = block.index;
  }
  if (!block.file_hash.empty()) {
    files_[block.file_hash].insert(block.index);
  }
  BOOST_LOG_TRIVIAL(trace) << "Content index: Recorded block " << block.index << " for file " << block.file_hash;
}

void ContentIndex::rebuild(const Chain& chain) {
  clear();
  for (const auto& block : chain.blocks()) {
    record(block);
  }
  BOOST_LOG_TRIVIAL(info) << "Content index: Rebuilt with " << blocks_.size() << " block(s) across " 
                          << files_.size() << " file(s)";
}

void ContentIndex::clear() {
  blocks_.clear();
  files_.clear();
}

bool ContentIndex::lookup_file(const std::string& file_hash) const {
  return files_.find(file_hash) != files_.end();
}

bool ContentIndex::lookup_block(const std::string& block_hash) const {
  return blocks_.find(block_hash) != blocks_.end();
}

std::optional<uint64_t> ContentIndex::block_index(const std::string& block_hash) const {
  auto it = blocks_.find(block_hash);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<uint64_t> ContentIndex::file_blocks(const std::string& file_hash) const {
  auto it = files_.find(file_hash);
  if (it == files_.end()) {
    return {};
  }
  return std::vector<uint64_t>(it->second.begin(), it->second.end());
}

} // namespace chain
} // namespace chainvault
