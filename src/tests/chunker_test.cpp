#include <gtest/gtest.h>
#include <sstream>
#include "chainvault/chain/chain_error.hpp"
#include "chainvault/chain/chunker.hpp"
#include "test_utils.hpp"

using namespace chainvault::chain;

class ChunkerTest : public ::testing::Test {
protected:
  static std::vector<uint8_t> pattern(size_t size) {
    std::vector<uint8_t> bytes(size);
    for (size_t i = 0; i < size; ++i) {
      bytes[i] = static_cast<uint8_t>((i * 31 + 7) % 256);
    }
    return bytes;
  }
};

TEST_F(ChunkerTest, SplitsIntoFixedSizeBlocks) {
  Chunker chunker(4);
  auto payloads = chunker.split(to_bytes("0123456789"));

  ASSERT_EQ(payloads.size(), 3u);
  EXPECT_EQ(payloads[0], to_bytes("0123"));
  EXPECT_EQ(payloads[1], to_bytes("4567"));
  EXPECT_EQ(payloads[2], to_bytes("89"));
}

TEST_F(ChunkerTest, ExactMultipleHasNoTrailingBlock) {
  Chunker chunker(5);
  auto payloads = chunker.split(to_bytes("0123456789"));
  ASSERT_EQ(payloads.size(), 2u);
  EXPECT_EQ(payloads[1], to_bytes("56789"));
}

TEST_F(ChunkerTest, EmptyInputYieldsOneEmptyBlock) {
  Chunker chunker(4);
  auto payloads = chunker.split(std::vector<uint8_t>());
  ASSERT_EQ(payloads.size(), 1u);
  EXPECT_TRUE(payloads[0].empty());
  EXPECT_TRUE(Chunker::reassemble(payloads).empty());
}

TEST_F(ChunkerTest, RoundTripsAcrossSizes) {
  for (size_t block_size : {1u, 3u, 500u}) {
    Chunker chunker(block_size);
    for (size_t size : {0u, 1u, 499u, 500u, 501u, 1777u}) {
      auto bytes = pattern(size);
      EXPECT_EQ(Chunker::reassemble(chunker.split(bytes)), bytes) 
        << "block size " << block_size << ", input size " << size;
    }
  }
}

TEST_F(ChunkerTest, StreamSplitMatchesVectorSplit) {
  Chunker chunker(64);
  auto bytes = pattern(1000);
  std::stringstream input(std::string(bytes.begin(), bytes.end()));

  EXPECT_EQ(chunker.split(input), chunker.split(bytes));
}

TEST_F(ChunkerTest, ReassemblesToStream) {
  Chunker chunker(3);
  std::ostringstream output;
  size_t written = Chunker::reassemble(chunker.split(to_bytes("hello world")), output);

  EXPECT_EQ(written, 11u);
  EXPECT_EQ(output.str(), "hello world");
}

TEST_F(ChunkerTest, RejectsEmptySequenceAndZeroBlockSize) {
  EXPECT_THROW(Chunker::reassemble(std::vector<Payload>()), ShapeError);
  std::ostringstream output;
  EXPECT_THROW(Chunker::reassemble(std::vector<Payload>(), output), ShapeError);
  EXPECT_THROW(Chunker(0), std::invalid_argument);
  EXPECT_EQ(Chunker().block_size(), Chunker::DEFAULT_BLOCK_SIZE);
}
