#ifndef CHAINVAULT_CHAIN_CONTENT_INDEX_HPP
#define CHAINVAULT_CHAIN_CONTENT_INDEX_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "chainvault/chain/block.hpp"
#include "chainvault/chain/chain.hpp"

namespace chainvault {
namespace chain {

// Maps block hashes and file hashes to chain indices.
// Derived entirely from the chain, so it can always be rebuilt.
class ContentIndex {
public:
  // ---- INDEX MAINTENANCE ----
  void record(const Block& block);
  // Clears and repopulates the index from one scan of the chain
  void rebuild(const Chain& chain);
  void clear();


  // ---- LOOKUPS ----
  bool lookup_file(const std::string& file_hash) const;
  bool lookup_block(const std::string& block_hash) const;
  std::optional<uint64_t> block_index(const std::string& block_hash) const;
  // Indices of the blocks belonging to a file in chain order, empty if unknown
  std::vector<uint64_t> file_blocks(const std::string& file_hash) const;


  // ---- GETTERS ----
  size_t file_count() const { return files_.size(); }
  size_t block_count() const { return blocks_.size(); }

private:
  // ---- PARAMETERS ----
  std::unordered_map<std::string, uint64_t> blocks_;
  std::unordered_map<std::string, std::set<uint64_t>> files_;
};

} // namespace chain
} // namespace chainvault

#endif // CHAINVAULT_CHAIN_CONTENT_INDEX_HPP
