#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace chunkd::crypto;

class DigestTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }
};

TEST_F(DigestTest, KnownVectors) {
  EXPECT_EQ(Sha256::hex_of(std::string()),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(Sha256::hex_of(std::string("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DigestTest, IncrementalMatchesOneShot) {
  Sha256 hasher;
  hasher.update("Hello, ", 7);
  hasher.update("World", 5);
  EXPECT_EQ(hasher.finalize_hex(), Sha256::hex_of(std::string("Hello, World")));
}

TEST_F(DigestTest, StreamOverload) {
  std::string data(100000, 'q');
  std::istringstream input(data);
  EXPECT_EQ(Sha256::hex_of(input), Sha256::hex_of(data));
}

TEST_F(DigestTest, FinalizeTwiceThrows) {
  Sha256 hasher;
  hasher.update("x", 1);
  hasher.finalize_hex();
  EXPECT_THROW(hasher.finalize_hex(), DigestError);
}

TEST_F(DigestTest, RandomHex) {
  std::set<std::string> seen;
  for (int i = 0; i < 32; ++i) {
    std::string value = random_hex(8);
    ASSERT_EQ(value.size(), 16u);
    EXPECT_EQ(value.find_first_not_of("0123456789abcdef"), std::string::npos);
    seen.insert(value);
  }
  EXPECT_EQ(seen.size(), 32u);
}
