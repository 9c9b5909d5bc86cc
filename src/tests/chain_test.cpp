#include <gtest/gtest.h>
#include "chainvault/chain/chain.hpp"
#include "chainvault/chain/chain_error.hpp"
#include "chainvault/crypto/hasher.hpp"
#include "test_utils.hpp"

using namespace chainvault::chain;
using chainvault::crypto::Sha256Hasher;

class ChainTest : public ::testing::Test {
protected:
  Chain chain;
  const std::string file_a = Sha256Hasher::hash_hex(std::string("file a"));
  const std::string file_b = Sha256Hasher::hash_hex(std::string("file b"));

  // Three blocks of file_a, then two of file_b
  void fill() {
    chain.append(to_bytes("a0"), file_a, 0, 3, "a.txt");
    chain.append(to_bytes("a1"), file_a, 1, 3, "a.txt");
    chain.append(to_bytes("a2"), file_a, 2, 3, "a.txt");
    chain.append(to_bytes("b0"), file_b, 0, 2, "b.txt");
    chain.append(to_bytes("b1"), file_b, 1, 2, "b.txt");
  }

  // Copy of the chain's blocks for out-of-band tampering
  std::vector<Block> snapshot() const {
    return chain.blocks();
  }
};

TEST_F(ChainTest, EmptyChainVerifies) {
  EXPECT_TRUE(chain.empty());
  EXPECT_TRUE(chain.verify().ok);
  EXPECT_EQ(chain.tail_hash(), genesis_hash());
  EXPECT_EQ(genesis_hash(), std::string(64, '0'));
}

TEST_F(ChainTest, AppendLinksBlocks) {
  Block genesis = chain.append(to_bytes("a0"), file_a, 0, 1, "a.txt");
  EXPECT_EQ(genesis.index, 0u);
  EXPECT_TRUE(genesis.is_genesis());
  EXPECT_EQ(genesis.prev_hash, genesis_hash());
  EXPECT_EQ(genesis.hash, Chain::compute_hash(genesis));
  EXPECT_TRUE(Sha256Hasher::is_hex_digest(genesis.hash));

  Block next = chain.append(to_bytes("b0"), file_b, 0, 1, "b.txt");
  EXPECT_EQ(next.index, 1u);
  EXPECT_EQ(next.prev_hash, genesis.hash);
  EXPECT_EQ(chain.tail_hash(), next.hash);
  EXPECT_EQ(chain.size(), 2u);
  EXPECT_EQ(chain.at(1), next);
  EXPECT_THROW(chain.at(2), std::out_of_range);
}

TEST_F(ChainTest, HashCoversIdentityAndPosition) {
  Block block = chain.append(to_bytes("data"), file_a, 0, 1, "a.txt");
  const std::string original = Chain::compute_hash(block);

  Block renamed = block;
  renamed.filename = "other.txt";
  EXPECT_NE(Chain::compute_hash(renamed), original);

  Block moved = block;
  moved.index = 7;
  EXPECT_NE(Chain::compute_hash(moved), original);

  Block reowned = block;
  reowned.file_hash = file_b;
  EXPECT_NE(Chain::compute_hash(reowned), original);

  Block relinked = block;
  relinked.prev_hash = file_b;
  EXPECT_NE(Chain::compute_hash(relinked), original);
}

TEST_F(ChainTest, VerifyPassesAfterAppends) {
  fill();
  VerifyResult result = chain.verify();
  EXPECT_TRUE(result.ok);
  EXPECT_FALSE(result.first_broken_index.has_value());
}

TEST_F(ChainTest, VerifyDetectsPayloadMutation) {
  fill();
  std::vector<Block> blocks = snapshot();
  blocks[2].payload[0] ^= 0x01;

  Chain tampered;
  tampered.restore(blocks);
  VerifyResult result = tampered.verify();
  EXPECT_FALSE(result.ok);
  ASSERT_TRUE(result.first_broken_index.has_value());
  EXPECT_EQ(*result.first_broken_index, 2u);
}

TEST_F(ChainTest, VerifyDetectsRehashedBlock) {
  fill();
  std::vector<Block> blocks = snapshot();
  // Recomputing the hash of a mutated block breaks the link of its successor
  blocks[1].payload = to_bytes("forged");
  blocks[1].hash = Chain::compute_hash(blocks[1]);

  Chain tampered;
  tampered.restore(blocks);
  VerifyResult result = tampered.verify();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.first_broken_index.value_or(0), 2u);
}

TEST_F(ChainTest, VerifyDetectsIndexAndGenesisDamage) {
  fill();
  std::vector<Block> blocks = snapshot();
  blocks.erase(blocks.begin() + 1);

  Chain gap;
  gap.restore(blocks);
  EXPECT_EQ(gap.verify().first_broken_index.value_or(99), 1u);

  blocks = snapshot();
  blocks[0].prev_hash = file_a;
  Chain bad_genesis;
  bad_genesis.restore(blocks);
  EXPECT_EQ(bad_genesis.verify().first_broken_index.value_or(99), 0u);
}

TEST_F(ChainTest, BlocksForFileOrderedBySequence) {
  fill();
  auto blocks = chain.blocks_for_file(file_b);
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[0].sequence, 0u);
  EXPECT_EQ(blocks[1].sequence, 1u);
  EXPECT_EQ(blocks[1].payload, to_bytes("b1"));

  EXPECT_THROW(chain.blocks_for_file(Sha256Hasher::hash_hex(std::string("missing"))), NotFoundError);
}

TEST_F(ChainTest, StageDoesNotMutateUntilCommit) {
  fill();
  std::vector<Payload> payloads = {to_bytes("c0"), to_bytes("c1")};
  std::string file_c = Sha256Hasher::hash_hex(std::string("c0c1"));

  auto staged = chain.stage(payloads, file_c, "c.txt");
  ASSERT_EQ(staged.size(), 2u);
  EXPECT_EQ(chain.size(), 5u);
  EXPECT_EQ(staged[0].index, 5u);
  EXPECT_EQ(staged[0].prev_hash, chain.tail_hash());
  EXPECT_EQ(staged[1].prev_hash, staged[0].hash);
  EXPECT_EQ(staged[1].total_blocks, 2u);

  chain.commit(staged);
  EXPECT_EQ(chain.size(), 7u);
  EXPECT_TRUE(chain.verify().ok);
}

TEST_F(ChainTest, CommitRejectsStaleRun) {
  fill();
  auto staged = chain.stage({to_bytes("late")}, file_a, "late.txt");
  chain.append(to_bytes("early"), file_b, 0, 1, "early.txt");

  EXPECT_THROW(chain.commit(staged), ShapeError);
  EXPECT_EQ(chain.size(), 6u);
  EXPECT_TRUE(chain.verify().ok);
  EXPECT_THROW(chain.stage({}, file_a, "none"), ShapeError);
}

TEST_F(ChainTest, RestoreOnlyIntoEmptyChain) {
  fill();
  Chain copy;
  copy.restore(snapshot());
  EXPECT_EQ(copy.size(), chain.size());
  EXPECT_EQ(copy.tail_hash(), chain.tail_hash());
  EXPECT_THROW(copy.restore(snapshot()), ShapeError);
}
