#include "chainvault/store/filesystem_backend.hpp"
#include "chainvault/store/block_record.hpp"
#include <boost/log/trivial.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace chainvault {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
FilesystemBackend::FilesystemBackend(const std::string& base_path) 
  : base_path_(base_path)
  , blocks_path_(base_path_ / "blocks") {
  BOOST_LOG_TRIVIAL(info) << "Filesystem backend: Initializing with base path: " << base_path;
  check_directory_exists(blocks_path_);
  BOOST_LOG_TRIVIAL(debug) << "Filesystem backend: Store directory created/verified at: " << blocks_path_.string();
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::vector<chain::Block> FilesystemBackend::load() {
  BOOST_LOG_TRIVIAL(info) << "Filesystem backend: Loading blocks from: " << blocks_path_.string();

  std::vector<chain::Block> blocks;
  for (uint64_t index = 0; ; ++index) {
    std::filesystem::path file_path = path_for_index(index);
    if (!record_exists(file_path)) {
      break;
    }

    try {
      blocks.push_back(BlockRecord::decode(read_record(file_path)));
    }
    catch (const RecordFormatError& e) {
      // Keep the position so verification reports it instead of silently shortening the chain
      BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Damaged record " << file_path.string() << ": " << e.what();
      chain::Block damaged;
      damaged.index = index;
      blocks.push_back(damaged);
    }
  }

  size_t on_disk = count_records();
  if (on_disk > blocks.size()) {
    BOOST_LOG_TRIVIAL(warning) << "Filesystem backend: " << (on_disk - blocks.size()) 
                               << " record(s) found after the first missing index were ignored";
  }

  BOOST_LOG_TRIVIAL(info) << "Filesystem backend: Loaded " << blocks.size() << " block(s)";
  return blocks;
}

void FilesystemBackend::persist(const chain::Block& block) {
  std::filesystem::path file_path = path_for_index(block.index);
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";

  BOOST_LOG_TRIVIAL(debug) << "Filesystem backend: Persisting block " << block.index << " to " << file_path.string();

  if (record_exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Record already exists: " << file_path.string();
    throw PersistenceFailure("Filesystem backend: Record already exists for index " + std::to_string(block.index));
  }

  std::vector<uint8_t> record = BlockRecord::encode(block);

  // Open output file in binary mode for cross-platform consistency
  std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to create file: " << temp_path.string();
    throw PersistenceFailure("Filesystem backend: Failed to create file: " + temp_path.string());
  }

  file.write(reinterpret_cast<const char*>(record.data()), record.size());
  file.flush();
  if (!file) {
    file.close();
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to write " << record.size() << " bytes to " << temp_path.string();
    throw PersistenceFailure("Filesystem backend: Failed to write record for index " + std::to_string(block.index));
  }
  file.close();

  std::error_code ec;
  if (!sync_path(temp_path)) {
    std::filesystem::remove(temp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to sync " << temp_path.string();
    throw PersistenceFailure("Filesystem backend: Failed to sync record for index " + std::to_string(block.index));
  }

  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code remove_ec;
    std::filesystem::remove(temp_path, remove_ec);
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to move record into place: " << ec.message();
    throw PersistenceFailure("Filesystem backend: Failed to commit record for index " + std::to_string(block.index));
  }

  // The rename is only durable once the directory entry is
  if (!sync_path(blocks_path_)) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to sync directory " << blocks_path_.string();
    throw PersistenceFailure("Filesystem backend: Failed to sync store directory for index " 
                             + std::to_string(block.index));
  }

  BOOST_LOG_TRIVIAL(debug) << "Filesystem backend: Persisted " << record.size() << " bytes for block " << block.index;
}

void FilesystemBackend::discard(const chain::Block& block) {
  std::filesystem::path file_path = path_for_index(block.index);
  BOOST_LOG_TRIVIAL(info) << "Filesystem backend: Discarding record for block " << block.index;

  std::error_code ec;
  std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to discard " << file_path.string() << ": " << ec.message();
    throw PersistenceFailure("Filesystem backend: Failed to discard record for index " + std::to_string(block.index));
  }
}

void FilesystemBackend::clear() {
  BOOST_LOG_TRIVIAL(info) << "Filesystem backend: Clearing entire store at: " << base_path_;
  std::error_code ec;
  std::filesystem::remove_all(blocks_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to clear store: " << ec.message();
    throw PersistenceFailure("Filesystem backend: Failed to clear store: " + ec.message());
  }
  check_directory_exists(blocks_path_);
  BOOST_LOG_TRIVIAL(info) << "Filesystem backend: Store cleared successfully";
}

//==============================================
// QUERY OPERATIONS
//==============================================

std::filesystem::path FilesystemBackend::path_for_index(uint64_t index) const {
  std::ostringstream name;
  name << std::setw(20) << std::setfill('0') << index << ".blk";
  return blocks_path_ / name.str();
}

//==============================================
// UTILITY METHODS 
//==============================================

void FilesystemBackend::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to create store directory: " << ec.message();
    throw PersistenceFailure("Filesystem backend: Failed to create store directory " + path.string() 
                             + ": " + ec.message());
  }
}

bool FilesystemBackend::record_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  bool found = std::filesystem::exists(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Cannot stat " << path.string() << ": " << ec.message();
    throw PersistenceFailure("Filesystem backend: Cannot access " + path.string() + ": " + ec.message());
  }
  return found;
}

bool FilesystemBackend::sync_path(const std::filesystem::path& path) const {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return false;
  }
  bool synced = ::fsync(fd) == 0;
  ::close(fd);
  return synced;
}

std::vector<uint8_t> FilesystemBackend::read_record(const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to open file: " << path.string();
    throw PersistenceFailure("Filesystem backend: Failed to open file: " + path.string());
  }

  std::vector<uint8_t> record;
  char buffer[4096];

  // Read file in chunks, then handle the final partial chunk
  while (file.read(buffer, sizeof(buffer))) {
    record.insert(record.end(), buffer, buffer + file.gcount());
  }
  if (file.gcount() > 0) {
    record.insert(record.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    throw PersistenceFailure("Filesystem backend: Failed to read file: " + path.string());
  }
  return record;
}

size_t FilesystemBackend::count_records() const {
  std::error_code ec;
  std::filesystem::directory_iterator it(blocks_path_, ec);
  size_t count = 0;
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && it->path().extension() == ".blk") {
      ++count;
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Cannot list " << blocks_path_.string() << ": " << ec.message();
    throw PersistenceFailure("Filesystem backend: Cannot list store directory: " + ec.message());
  }
  return count;
}

} // namespace store
} // namespace chainvault
