#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "chainvault/store/persistence_backend.hpp"

namespace chainvault {
namespace store {

// One record file per block under {base_path}/blocks/{index, 20 digits}.blk
class FilesystemBackend : public PersistenceBackend {
public:
  static constexpr const char* DEFAULT_PATH = ".blockchain";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FilesystemBackend(const std::string& base_path = DEFAULT_PATH);


  // ---- CORE STORAGE OPERATIONS ----
  // Reads records for indices 0,1,2... until the first missing one
  std::vector<chain::Block> load() override;
  // Writes the record to a temporary file and renames it into place
  void persist(const chain::Block& block) override;
  void discard(const chain::Block& block) override;
  // Removes all records and resets the store
  void clear() override;

  std::string name() const override { return "filesystem"; }


  // ---- QUERY OPERATIONS ----
  // Resolves a block index to its record file path
  std::filesystem::path path_for_index(uint64_t index) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored records
  std::filesystem::path base_path_;
  std::filesystem::path blocks_path_;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Throws PersistenceFailure when the path cannot be inspected
  bool record_exists(const std::filesystem::path& path) const;
  // fsync of a file or directory
  bool sync_path(const std::filesystem::path& path) const;
  std::vector<uint8_t> read_record(const std::filesystem::path& path) const;
  // Counts record files, used to report records beyond the first gap
  size_t count_records() const;
};

} // namespace store
} // namespace chainvault
