// Repository: Triptych-ingest
// Component: Content hasher unit tests

#include <gtest/gtest.h>

#include <string>

#include "triptych/storage/IKeyValueStore.hpp"
#include "triptych/upload/ContentHasher.hpp"

namespace triptych::upload {
namespace {

TEST(ContentHasherTest, KnownVectors) {
  EXPECT_EQ(Sha256Hex(storage::ToBytes("")),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(Sha256Hex(storage::ToBytes("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHasherTest, DigestComparisonIgnoresCase) {
  EXPECT_TRUE(DigestsMatch("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD",
                           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
  EXPECT_FALSE(DigestsMatch("ab", "ac"));
  EXPECT_FALSE(DigestsMatch("", ""));
}

}  // namespace
}  // namespace triptych::upload
