#ifndef CHAINVAULT_CHAIN_CHAIN_HPP
#define CHAINVAULT_CHAIN_CHAIN_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "chainvault/chain/block.hpp"
#include "chainvault/chain/chunker.hpp"

namespace chainvault {
namespace chain {

struct VerifyResult {
  bool ok = true;
  std::optional<uint64_t> first_broken_index;
};

// Append-only, hash-linked sequence of blocks.
// Not synchronized: the owning Ledger serializes every access.
class Chain {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Chain() = default;
  ~Chain() = default;


  // ---- HASHING ----
  // SHA-256 over index, sequence, total_blocks, file_hash, filename, prev_hash and payload
  static std::string compute_hash(const Block& block);


  // ---- MUTATION ----
  // Links a new block to the tail and appends it
  Block append(const Payload& payload, const std::string& file_hash, uint64_t sequence,
               uint64_t total_blocks, const std::string& filename);
  // Builds a linked run of blocks for one file starting at the tail, without appending
  std::vector<Block> stage(const std::vector<Payload>& payloads, const std::string& file_hash,
                           const std::string& filename) const;
  // Appends a staged run after checking it still links to the tail
  void commit(const std::vector<Block>& staged);
  // Loads persisted blocks into an empty chain as-is; damaged blocks are kept for verify()
  void restore(std::vector<Block> blocks);


  // ---- INTEGRITY ----
  // Recomputes every hash in index order and checks linkage
  VerifyResult verify() const;


  // ---- QUERY OPERATIONS ----
  // All blocks of a file ordered by sequence, throws NotFoundError if none match
  std::vector<Block> blocks_for_file(const std::string& file_hash) const;
  const Block& at(uint64_t index) const;
  const std::vector<Block>& blocks() const { return blocks_; }
  uint64_t size() const { return blocks_.size(); }
  bool empty() const { return blocks_.empty(); }
  // Hash the next block links to
  const std::string& tail_hash() const;

private:
  // ---- PARAMETERS ----
  std::vector<Block> blocks_;


  // ---- HELPERS ----
  static Block make_block(uint64_t index, const std::string& prev_hash, const Payload& payload,
                          const std::string& file_hash, uint64_t sequence, uint64_t total_blocks,
                          const std::string& filename);
  // Returns false if block is not a valid successor at position index
  static bool links_to(const Block& block, uint64_t index, const std::string& prev_hash);
};

} // namespace chain
} // namespace chainvault

#endif // CHAINVAULT_CHAIN_CHAIN_HPP
