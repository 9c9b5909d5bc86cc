#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "chainvault/chain/chain.hpp"
#include "chainvault/crypto/hasher.hpp"
#include "chainvault/store/block_record.hpp"
#include "chainvault/store/filesystem_backend.hpp"
#include "chainvault/store/memory_backend.hpp"
#include "test_utils.hpp"

using namespace chainvault::store;
using chainvault::chain::Block;
using chainvault::chain::Chain;
using chainvault::crypto::Sha256Hasher;

class StoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FilesystemBackend> backend;
  Chain chain;

  void SetUp() override {
    test_dir = make_temp_dir("store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    backend = std::make_unique<FilesystemBackend>(test_dir.string());
  }

  void TearDown() override {
    backend.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::vector<Block> make_blocks(size_t count) {
    std::string file_hash = Sha256Hasher::hash_hex(std::string("content"));
    for (size_t i = 0; i < count; ++i) {
      chain.append(to_bytes("payload " + std::to_string(i)), file_hash, i, count, "content.txt");
    }
    return chain.blocks();
  }

  static std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  static void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  }
};

TEST_F(StoreTest, RecordPreservesEveryField) {
  Block block = make_blocks(2)[1];
  Block decoded = BlockRecord::decode(BlockRecord::encode(block));
  EXPECT_EQ(decoded, block);
  EXPECT_EQ(decoded.filename, "content.txt");
  EXPECT_EQ(decoded.total_blocks, 2u);
}

TEST_F(StoreTest, RecordRejectsMalformedInput) {
  std::vector<uint8_t> record = BlockRecord::encode(make_blocks(1)[0]);

  std::vector<uint8_t> bad_magic = record;
  bad_magic[0] = 'X';
  EXPECT_THROW(BlockRecord::decode(bad_magic), RecordFormatError);

  std::vector<uint8_t> bad_version = record;
  bad_version[4] = BlockRecord::VERSION + 1;
  EXPECT_THROW(BlockRecord::decode(bad_version), RecordFormatError);

  std::vector<uint8_t> truncated(record.begin(), record.end() - 1);
  EXPECT_THROW(BlockRecord::decode(truncated), RecordFormatError);

  std::vector<uint8_t> trailing = record;
  trailing.push_back(0);
  EXPECT_THROW(BlockRecord::decode(trailing), RecordFormatError);

  EXPECT_THROW(BlockRecord::decode({}), RecordFormatError);
}

TEST_F(StoreTest, PersistAndLoad) {
  auto blocks = make_blocks(3);
  for (const auto& block : blocks) {
    backend->persist(block);
    EXPECT_TRUE(std::filesystem::exists(backend->path_for_index(block.index)));
  }
  EXPECT_EQ(backend->path_for_index(1).filename().string(), "00000000000000000001.blk");

  FilesystemBackend reopened(test_dir.string());
  EXPECT_EQ(reopened.load(), blocks);
  EXPECT_EQ(reopened.name(), "filesystem");
}

TEST_F(StoreTest, PersistNeverOverwrites) {
  auto blocks = make_blocks(1);
  backend->persist(blocks[0]);
  EXPECT_THROW(backend->persist(blocks[0]), PersistenceFailure);
  EXPECT_EQ(backend->load(), blocks);
}

TEST_F(StoreTest, DiscardAndClear) {
  auto blocks = make_blocks(3);
  for (const auto& block : blocks) {
    backend->persist(block);
  }

  backend->discard(blocks[2]);
  EXPECT_EQ(backend->load().size(), 2u);

  backend->clear();
  EXPECT_TRUE(backend->load().empty());
  // Store is usable again after a reset
  backend->persist(blocks[0]);
  EXPECT_EQ(backend->load().size(), 1u);
}

TEST_F(StoreTest, LoadStopsAtFirstMissingIndex) {
  auto blocks = make_blocks(3);
  backend->persist(blocks[0]);
  backend->persist(blocks[2]);

  auto loaded = backend->load();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0], blocks[0]);
}

TEST_F(StoreTest, DamagedRecordLoadsAsPlaceholder) {
  auto blocks = make_blocks(3);
  for (const auto& block : blocks) {
    backend->persist(block);
  }
  write_file(backend->path_for_index(1), to_bytes("garbage"));

  auto loaded = backend->load();
  ASSERT_EQ(loaded.size(), 3u);
  EXPECT_EQ(loaded[1].index, 1u);
  EXPECT_TRUE(loaded[1].hash.empty());
  EXPECT_EQ(loaded[2], blocks[2]);

  Chain restored;
  restored.restore(loaded);
  EXPECT_EQ(restored.verify().first_broken_index.value_or(99), 1u);
}

TEST_F(StoreTest, FlippedPayloadByteIsDetected) {
  auto blocks = make_blocks(2);
  for (const auto& block : blocks) {
    backend->persist(block);
  }
  auto record = read_file(backend->path_for_index(0));
  record.back() ^= 0x01;
  write_file(backend->path_for_index(0), record);

  auto loaded = backend->load();
  ASSERT_EQ(loaded.size(), 2u);
  EXPECT_NE(loaded[0].payload, blocks[0].payload);

  Chain restored;
  restored.restore(loaded);
  EXPECT_EQ(restored.verify().first_broken_index.value_or(99), 0u);
}

TEST_F(StoreTest, UnreachableDirectoryIsPersistenceFailure) {
  std::vector<Block> blocks = make_blocks(2);
  backend->persist(blocks[0]);
  make_unreachable(test_dir / "blocks");

  EXPECT_THROW(backend->persist(blocks[1]), PersistenceFailure);
  EXPECT_THROW(backend->load(), PersistenceFailure);
  EXPECT_THROW(FilesystemBackend{test_dir.string()}, PersistenceFailure);
}

TEST(MemoryBackendTest, KeepsNothing) {
  MemoryBackend backend;
  Block block;
  backend.persist(block);
  backend.discard(block);
  backend.clear();
  EXPECT_TRUE(backend.load().empty());
  EXPECT_EQ(backend.name(), "memory");
}
