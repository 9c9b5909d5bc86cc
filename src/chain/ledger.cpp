#include "chainvault/chain/ledger.hpp"
#include "chainvault/chain/chain_error.hpp"
#include "chainvault/crypto/hasher.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace chainvault {
namespace chain {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Ledger::Ledger(std::unique_ptr<store::PersistenceBackend> backend, size_t max_block_size)
  : backend_(std::move(backend))
  , max_block_size_(max_block_size) {
  if (!backend_) {
    throw std::invalid_argument("Ledger: Persistence backend is required");
  }
  if (max_block_size_ == 0) {
    throw std::invalid_argument("Ledger: Block size must be positive");
  }
  BOOST_LOG_TRIVIAL(info) << "Ledger: Initializing with " << backend_->name() 
                          << " backend and block size " << max_block_size_;
}

//==============================================
// STARTUP
//==============================================

VerifyResult Ledger::open() {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  std::vector<Block> blocks = backend_->load();
  drop_unfinished_tail(blocks);
  chain_.restore(std::move(blocks));

  VerifyResult result = chain_.verify();
  if (result.ok) {
    BOOST_LOG_TRIVIAL(info) << "Ledger: Opened chain of " << chain_.size() << " block(s), verification passed";
  } else {
    BOOST_LOG_TRIVIAL(error) << "Ledger: Opened chain of " << chain_.size() 
                             << " block(s), verification failed at index " << *result.first_broken_index;
  }

  index_.rebuild(chain_);
  return result;
}

//==============================================
// MUTATION
//==============================================

AddResult Ledger::add_file(const std::string& file_hash, const std::string& filename,
                           const std::vector<Payload>& payloads) {
  BOOST_LOG_TRIVIAL(info) << "Ledger: Adding file " << file_hash << " (" << filename << ") with " 
                          << payloads.size() << " block(s)";

  // Hashing the content happens outside the lock
  validate_payloads(file_hash, payloads);

  std::unique_lock<std::shared_mutex> lock(mutex_);

  AddResult result;
  std::vector<Block> existing = collect_file(file_hash);
  if (!existing.empty() && is_complete(existing)) {
    result.first_index = existing.front().index;
    result.block_count = existing.size();
    result.already_present = true;
    BOOST_LOG_TRIVIAL(info) << "Ledger: File " << file_hash << " already stored at index " << result.first_index;
    return result;
  }

  std::vector<Block> staged = chain_.stage(payloads, file_hash, filename);
  persist_all(staged);

  chain_.commit(staged);
  for (const auto& block : staged) {
    index_.record(block);
  }

  result.first_index = staged.front().index;
  result.block_count = staged.size();
  BOOST_LOG_TRIVIAL(info) << "Ledger: Committed file " << file_hash << " at indices " << result.first_index 
                          << ".." << staged.back().index;
  return result;
}

void Ledger::validate_payloads(const std::string& file_hash, const std::vector<Payload>& payloads) const {
  if (!crypto::Sha256Hasher::is_hex_digest(file_hash)) {
    throw ShapeError("File hash is not a SHA-256 hex digest: " + file_hash);
  }
  if (payloads.empty()) {
    throw ShapeError("File has no blocks");
  }

  crypto::Sha256Hasher hasher;
  for (const auto& payload : payloads) {
    if (payload.size() > max_block_size_) {
      throw ShapeError("Block of " + std::to_string(payload.size()) + " bytes exceeds limit of " 
                       + std::to_string(max_block_size_));
    }
    hasher.update(payload);
  }

  std::string actual = hasher.hex_digest();
  if (actual != file_hash) {
    BOOST_LOG_TRIVIAL(warning) << "Ledger: Content hash mismatch for " << file_hash;
    throw ContentMismatchError(file_hash, actual);
  }
}

void Ledger::persist_all(const std::vector<Block>& staged) {
  size_t persisted = 0;
  try {
    for (const auto& block : staged) {
      backend_->persist(block);
      ++persisted;
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Ledger: Persistence failed after " << persisted << " of " << staged.size() 
                             << " block(s): " << e.what();

    // Undo in reverse so a later restart never sees part of this file
    for (size_t i = persisted; i > 0; --i) {
      try {
        backend_->discard(staged[i - 1]);
      }
      catch (const store::PersistenceFailure& discard_error) {
        BOOST_LOG_TRIVIAL(error) << "Ledger: Could not discard block " << staged[i - 1].index 
                                 << ": " << discard_error.what();
      }
    }
    throw;
  }
}

// Records are written in chain order, so a crash during an ADD can only
// leave the first blocks of one file at the end of the store
void Ledger::drop_unfinished_tail(std::vector<Block>& blocks) {
  if (blocks.empty()) {
    return;
  }

  const Block& last = blocks.back();
  if (last.hash.empty() || last.sequence + 1 >= last.total_blocks || last.sequence >= blocks.size()) {
    return;
  }

  size_t start = blocks.size() - 1 - static_cast<size_t>(last.sequence);
  for (size_t i = start; i < blocks.size(); ++i) {
    const Block& block = blocks[i];
    const std::string& expected_prev = i == 0 ? genesis_hash() : blocks[i - 1].hash;
    // Anything that does not look like an intact run is left for verify() to report
    if (block.file_hash != last.file_hash || block.total_blocks != last.total_blocks ||
        block.sequence != i - start || block.index != i || block.prev_hash != expected_prev ||
        block.hash.empty() || Chain::compute_hash(block) != block.hash) {
      return;
    }
  }

  BOOST_LOG_TRIVIAL(warning) << "Ledger: Dropping " << (blocks.size() - start) << " of " << last.total_blocks 
                             << " block(s) of unfinished file " << last.file_hash << " at index " << start;
  for (size_t i = blocks.size(); i > start; --i) {
    backend_->discard(blocks[i - 1]);
  }
  blocks.resize(start);
}

//==============================================
// QUERY OPERATIONS
//==============================================

CheckResult Ledger::check_hash(const std::string& hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  CheckResult result;

  if (index_.lookup_file(hash)) {
    std::vector<Block> blocks = collect_file(hash);
    result.kind = HashKind::FILE;
    result.block_count = blocks.size();
    result.first_broken_index = find_damage(hash, blocks);
    result.intact = !result.first_broken_index.has_value();

    BOOST_LOG_TRIVIAL(info) << "Ledger: File " << hash << " stored as " << result.block_count 
                            << " block(s), " << (result.intact ? "intact" : "damaged");
    return result;
  }

  if (auto position = index_.block_index(hash)) {
    result.kind = HashKind::BLOCK;
    result.block_count = 1;
    result.intact = Chain::compute_hash(chain_.at(*position)) == hash;
    if (!result.intact) {
      result.first_broken_index = *position;
    }
    BOOST_LOG_TRIVIAL(info) << "Ledger: Block " << hash << " found at index " << *position;
    return result;
  }

  BOOST_LOG_TRIVIAL(info) << "Ledger: Hash " << hash << " not stored";
  return result;
}

VerifyResult Ledger::verify() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.verify();
}

std::vector<Block> Ledger::get_file(const std::string& file_hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<Block> blocks = collect_file(file_hash);
  if (blocks.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Ledger: File " << file_hash << " not found";
    throw NotFoundError(file_hash);
  }

  if (auto broken = find_damage(file_hash, blocks)) {
    BOOST_LOG_TRIVIAL(error) << "Ledger: File " << file_hash << " is damaged at index " << *broken;
    throw CorruptionError(*broken);
  }

  BOOST_LOG_TRIVIAL(info) << "Ledger: Resolved file " << file_hash << " to " << blocks.size() << " block(s)";
  return blocks;
}

uint64_t Ledger::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.size();
}

//==============================================
// HELPERS
//==============================================

std::vector<Block> Ledger::collect_file(const std::string& file_hash) const {
  std::vector<Block> blocks;
  for (uint64_t position : index_.file_blocks(file_hash)) {
    blocks.push_back(chain_.at(position));
  }

  std::stable_sort(blocks.begin(), blocks.end(),
    [](const Block& lhs, const Block& rhs) { return lhs.sequence < rhs.sequence; });
  return blocks;
}

bool Ledger::is_complete(const std::vector<Block>& blocks) const {
  if (blocks.empty() || blocks.front().total_blocks != blocks.size()) {
    return false;
  }
  for (uint64_t i = 0; i < blocks.size(); ++i) {
    if (blocks[i].sequence != i) {
      return false;
    }
  }
  return true;
}

std::optional<uint64_t> Ledger::find_damage(const std::string& file_hash, const std::vector<Block>& blocks) const {
  crypto::Sha256Hasher hasher;
  for (const auto& block : blocks) {
    if (block.hash.empty() || Chain::compute_hash(block) != block.hash) {
      return block.index;
    }
    hasher.update(block.payload);
  }

  if (blocks.empty() || !is_complete(blocks) || hasher.hex_digest() != file_hash) {
    return blocks.empty() ? 0 : blocks.front().index;
  }
  return std::nullopt;
}

} // namespace chain
} // namespace chainvault
