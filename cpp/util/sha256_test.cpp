#include "util/sha256.hpp"
#include <kj/exception.h>
#include "gtest/gtest.h"

namespace {

util::SHA256_t hashOf(const std::string& data) {
  util::SHA256 hasher;
  hasher.update(data);
  return hasher.finalize();
}

// NOLINTNEXTLINE
TEST(SHA256, KnownVectors) {
  EXPECT_EQ(hashOf("abc").Hex(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(hashOf("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")
                .Hex(),
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
  EXPECT_EQ(hashOf("").Hex(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// NOLINTNEXTLINE
TEST(SHA256, IncrementalUpdate) {
  std::string data(1000, 'a');
  for (size_t i = 0; i < data.size(); i++) data[i] += i % 26;
  util::SHA256 hasher;
  for (size_t pos = 0; pos < data.size(); pos += 37) {
    hasher.update(data.substr(pos, 37));
  }
  EXPECT_EQ(hasher.finalize(), hashOf(data));
}

// NOLINTNEXTLINE
TEST(SHA256, HexRoundTrip) {
  util::SHA256_t hash = hashOf("abc");
  util::SHA256_t parsed(hash.Hex());
  EXPECT_EQ(parsed, hash);
  util::SHA256_t from_bytes(hash.Bytes());
  EXPECT_EQ(from_bytes, hash);
}

// NOLINTNEXTLINE
TEST(SHA256, UppercaseHex) {
  util::SHA256_t parsed(
      "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
  EXPECT_EQ(parsed, hashOf("abc"));
}

// NOLINTNEXTLINE
TEST(SHA256, InvalidHex) {
  EXPECT_THROW(util::SHA256_t("abc"), kj::Exception);  // NOLINT
  EXPECT_THROW(util::SHA256_t(std::string(64, 'z')),   // NOLINT
               kj::Exception);
}

// NOLINTNEXTLINE
TEST(SHA256, Zero) {
  EXPECT_TRUE(util::SHA256_t::ZERO.isZero());
  EXPECT_FALSE(hashOf("").isZero());
  EXPECT_NE(util::SHA256_t::ZERO, hashOf(""));
}

}  // namespace
