#include <gtest/gtest.h>
#include "chainvault/chain/content_index.hpp"
#include "chainvault/crypto/hasher.hpp"
#include "test_utils.hpp"

using namespace chainvault::chain;
using chainvault::crypto::Sha256Hasher;

class ContentIndexTest : public ::testing::Test {
protected:
  Chain chain;
  ContentIndex index;
  const std::string file_a = Sha256Hasher::hash_hex(std::string("a"));
  const std::string file_b = Sha256Hasher::hash_hex(std::string("b"));
};

TEST_F(ContentIndexTest, RecordsBlocksAndFiles) {
  Block first = chain.append(to_bytes("a0"), file_a, 0, 2, "a");
  Block second = chain.append(to_bytes("b0"), file_b, 0, 1, "b");
  Block third = chain.append(to_bytes("a1"), file_a, 1, 2, "a");
  for (const auto& block : chain.blocks()) {
    index.record(block);
  }

  EXPECT_TRUE(index.lookup_file(file_a));
  EXPECT_TRUE(index.lookup_block(second.hash));
  EXPECT_FALSE(index.lookup_file(second.hash));
  EXPECT_FALSE(index.lookup_block(file_a));
  EXPECT_EQ(index.block_index(third.hash).value_or(99), 2u);
  EXPECT_EQ(index.file_blocks(file_a), (std::vector<uint64_t>{0, 2}));
  EXPECT_TRUE(index.file_blocks(Sha256Hasher::hash_hex(std::string("c"))).empty());
  EXPECT_EQ(index.file_count(), 2u);
  EXPECT_EQ(index.block_count(), 3u);
  EXPECT_EQ(first.index, 0u);
}

TEST_F(ContentIndexTest, RebuildMatchesIncrementalRecording) {
  ContentIndex incremental;
  for (int i = 0; i < 4; ++i) {
    incremental.record(chain.append(to_bytes("p" + std::to_string(i)), i % 2 ? file_a : file_b, i / 2, 2, "f"));
  }

  index.record(chain.at(0));
  index.rebuild(chain);
  EXPECT_EQ(index.block_count(), incremental.block_count());
  EXPECT_EQ(index.file_blocks(file_a), incremental.file_blocks(file_a));
  EXPECT_EQ(index.file_blocks(file_b), incremental.file_blocks(file_b));

  index.clear();
  EXPECT_EQ(index.block_count(), 0u);
  EXPECT_FALSE(index.lookup_file(file_a));
}

TEST_F(ContentIndexTest, SkipsDamagedBlocks) {
  Block damaged;
  damaged.index = 0;
  index.record(damaged);

  EXPECT_EQ(index.block_count(), 0u);
  EXPECT_EQ(index.file_count(), 0u);
  EXPECT_FALSE(index.lookup_block(""));
}
