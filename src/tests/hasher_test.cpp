#include <gtest/gtest.h>
#include "chainvault/crypto/hasher.hpp"
#include "test_utils.hpp"

using namespace chainvault::crypto;

namespace {
const std::string EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

TEST(HasherTest, KnownDigests) {
  EXPECT_EQ(Sha256Hasher::hash_hex(std::string()), EMPTY_SHA256);
  EXPECT_EQ(Sha256Hasher::hash_hex(std::string("abc")), ABC_SHA256);
  EXPECT_EQ(Sha256Hasher::hash_hex(to_bytes("abc")), ABC_SHA256);
}

TEST(HasherTest, IncrementalMatchesOneShot) {
  Sha256Hasher hasher;
  hasher.update(to_bytes("a")).update(to_bytes("")).update(to_bytes("bc"));
  EXPECT_EQ(hasher.hex_digest(), ABC_SHA256);
}

TEST(HasherTest, DigestResetsState) {
  Sha256Hasher hasher;
  hasher.update(to_bytes("abc"));
  EXPECT_EQ(hasher.hex_digest(), ABC_SHA256);
  // Nothing fed since the last digest
  EXPECT_EQ(hasher.hex_digest(), EMPTY_SHA256);
}

TEST(HasherTest, FieldEncodingIsUnambiguous) {
  Sha256Hasher first;
  first.update_string("ab").update_string("c");
  Sha256Hasher second;
  second.update_string("a").update_string("bc");
  EXPECT_NE(first.hex_digest(), second.hex_digest());

  Sha256Hasher number;
  number.update_u64(1);
  std::vector<uint8_t> big_endian_one = {0, 0, 0, 0, 0, 0, 0, 1};
  EXPECT_EQ(number.hex_digest(), Sha256Hasher::hash_hex(big_endian_one));
}

TEST(HasherTest, RecognizesHexDigests) {
  EXPECT_TRUE(Sha256Hasher::is_hex_digest(ABC_SHA256));
  EXPECT_TRUE(Sha256Hasher::is_hex_digest(std::string(64, '0')));
  EXPECT_FALSE(Sha256Hasher::is_hex_digest(""));
  EXPECT_FALSE(Sha256Hasher::is_hex_digest(ABC_SHA256.substr(1)));
  EXPECT_FALSE(Sha256Hasher::is_hex_digest("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
  EXPECT_FALSE(Sha256Hasher::is_hex_digest(std::string(63, 'a') + "g"));
}
