#ifndef CHAINVAULT_CHAIN_LEDGER_HPP
#define CHAINVAULT_CHAIN_LEDGER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "chainvault/chain/chain.hpp"
#include "chainvault/chain/chunker.hpp"
#include "chainvault/chain/content_index.hpp"
#include "chainvault/store/persistence_backend.hpp"

namespace chainvault {
namespace chain {

struct AddResult {
  uint64_t first_index = 0;
  uint64_t block_count = 0;
  // File was already stored, nothing was appended
  bool already_present = false;
};

enum class HashKind {
  ABSENT,
  FILE,
  BLOCK
};

struct CheckResult {
  HashKind kind = HashKind::ABSENT;
  uint64_t block_count = 0;
  // The stored blocks still regenerate the looked up hash
  bool intact = true;
  std::optional<uint64_t> first_broken_index;
};

// Owns the chain, its content index and the persistence backend.
// Writers hold mutex_ exclusively, readers share it.
class Ledger {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Ledger(std::unique_ptr<store::PersistenceBackend> backend, 
         size_t max_block_size = Chunker::DEFAULT_BLOCK_SIZE);

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;


  // ---- STARTUP ----
  // Loads persisted blocks, drops an ADD cut short by a crash, verifies
  // the rest and rebuilds the index
  VerifyResult open();


  // ---- MUTATION ----
  // Appends all payloads of one file or nothing at all
  AddResult add_file(const std::string& file_hash, const std::string& filename,
                     const std::vector<Payload>& payloads);


  // ---- QUERY OPERATIONS ----
  CheckResult check_hash(const std::string& hash) const;
  VerifyResult verify() const;
  // Blocks of a file ordered by sequence. Throws NotFoundError if absent
  // and CorruptionError if the blocks no longer regenerate the file hash.
  std::vector<Block> get_file(const std::string& file_hash) const;


  // ---- GETTERS ----
  uint64_t size() const;
  size_t max_block_size() const { return max_block_size_; }
  const store::PersistenceBackend& backend() const { return *backend_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<store::PersistenceBackend> backend_;
  size_t max_block_size_;
  Chain chain_;
  ContentIndex index_;
  mutable std::shared_mutex mutex_;


  // ---- HELPERS ----
  void validate_payloads(const std::string& file_hash, const std::vector<Payload>& payloads) const;
  // Caller must hold mutex_
  std::vector<Block> collect_file(const std::string& file_hash) const;
  // Caller must hold mutex_. True if every sequence 0..total-1 is stored once
  bool is_complete(const std::vector<Block>& blocks) const;
  // Caller must hold mutex_. Index of the first block that fails to reproduce
  // its own hash or the file hash, empty if the file is intact
  std::optional<uint64_t> find_damage(const std::string& file_hash, const std::vector<Block>& blocks) const;
  void persist_all(const std::vector<Block>& staged);
  // Discards the trailing blocks of a file whose ADD never finished
  void drop_unfinished_tail(std::vector<Block>& blocks);
};

} // namespace chain
} // namespace chainvault

#endif // CHAINVAULT_CHAIN_LEDGER_HPP
