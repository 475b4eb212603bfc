// Repository: Triptych-ingest
// Component: Chunk store unit tests

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>

#include "fixtures/FaultyKeyValueStore.h"
#include "triptych/storage/InMemoryKeyValueStore.hpp"
#include "triptych/upload/ChunkStore.hpp"

namespace triptych::upload {
namespace {

class ChunkStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    kv_ = std::make_shared<storage::InMemoryKeyValueStore>();
    chunks_ = std::make_unique<ChunkStore>(kv_);
  }

  std::shared_ptr<storage::InMemoryKeyValueStore> kv_;
  std::unique_ptr<ChunkStore> chunks_;
};

TEST_F(ChunkStoreTest, KeysAreZeroPaddedUnderSessionPrefix) {
  EXPECT_EQ(ChunkStore::ChunkKey("s1", 7), "chunks/s1/000007");
  EXPECT_EQ(ChunkStore::ChunkPrefix("s1"), "chunks/s1/");
}

TEST_F(ChunkStoreTest, OpenRejectsSecondOpenAndNonPositiveCount) {
  EXPECT_TRUE(chunks_->Open("s1", 3));
  EXPECT_FALSE(chunks_->Open("s1", 3));
  EXPECT_FALSE(chunks_->Open("s2", 0));
  EXPECT_TRUE(chunks_->IsOpen("s1"));
  EXPECT_FALSE(chunks_->IsOpen("s2"));
}

TEST_F(ChunkStoreTest, PutOutOfOrderThenAssembleInIndexOrder) {
  ASSERT_TRUE(chunks_->Open("s1", 3));
  EXPECT_EQ(chunks_->Put("s1", 2, storage::ToBytes("cc")), UploadError::kNone);
  EXPECT_EQ(chunks_->Put("s1", 0, storage::ToBytes("aa")), UploadError::kNone);
  EXPECT_EQ(chunks_->Put("s1", 1, storage::ToBytes("bb")), UploadError::kNone);

  auto result = chunks_->Assemble("s1");
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(storage::ToString(result.bytes), "aabbcc");
}

TEST_F(ChunkStoreTest, DuplicateReplacesBytes) {
  ASSERT_TRUE(chunks_->Open("s1", 1));
  EXPECT_EQ(chunks_->Put("s1", 0, storage::ToBytes("old")), UploadError::kNone);
  EXPECT_EQ(chunks_->Put("s1", 0, storage::ToBytes("new")), UploadError::kDuplicate);
  EXPECT_EQ(chunks_->ListPresent("s1").size(), 1u);
  EXPECT_EQ(storage::ToString(chunks_->Assemble("s1").bytes), "new");
}

TEST_F(ChunkStoreTest, IndexBoundaries) {
  ASSERT_TRUE(chunks_->Open("s1", 2));
  EXPECT_EQ(chunks_->Put("s1", -1, storage::ToBytes("x")), UploadError::kIndexOutOfRange);
  EXPECT_EQ(chunks_->Put("s1", 2, storage::ToBytes("x")), UploadError::kIndexOutOfRange);
  EXPECT_EQ(chunks_->Put("missing", 0, storage::ToBytes("x")), UploadError::kNotFound);
  EXPECT_TRUE(chunks_->ListPresent("s1").empty());
}

TEST_F(ChunkStoreTest, AssembleReportsMissingIndices) {
  ASSERT_TRUE(chunks_->Open("s1", 4));
  ASSERT_EQ(chunks_->Put("s1", 1, storage::ToBytes("b")), UploadError::kNone);
  ASSERT_EQ(chunks_->Put("s1", 3, storage::ToBytes("d")), UploadError::kNone);

  auto result = chunks_->Assemble("s1");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, UploadError::kIncomplete);
  EXPECT_EQ(result.missing_indices, (std::vector<int64_t>{0, 2}));
}

TEST_F(ChunkStoreTest, LostChunkOnAssembleIsStorageError) {
  ASSERT_TRUE(chunks_->Open("s1", 2));
  ASSERT_EQ(chunks_->Put("s1", 0, storage::ToBytes("a")), UploadError::kNone);
  ASSERT_EQ(chunks_->Put("s1", 1, storage::ToBytes("b")), UploadError::kNone);
  ASSERT_TRUE(kv_->Delete(ChunkStore::ChunkKey("s1", 1)));

  auto result = chunks_->Assemble("s1");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, UploadError::kStorageError);
}

TEST(ChunkStoreFaultTest, FailedWriteIsStorageErrorAndNotRecorded) {
  auto kv = std::make_shared<tests::fixtures::FaultyKeyValueStore>();
  ChunkStore chunks(kv);
  ASSERT_TRUE(chunks.Open("s1", 2));
  kv->FailPutsWithPrefix("chunks/");
  EXPECT_EQ(chunks.Put("s1", 0, storage::ToBytes("a")), UploadError::kStorageError);
  EXPECT_TRUE(chunks.ListPresent("s1").empty());

  kv->FailPutsWithPrefix("");
  EXPECT_EQ(chunks.Put("s1", 0, storage::ToBytes("a")), UploadError::kNone);
}

TEST_F(ChunkStoreTest, DeleteRemovesChunksAndIsIdempotent) {
  ASSERT_TRUE(chunks_->Open("s1", 2));
  ASSERT_EQ(chunks_->Put("s1", 0, storage::ToBytes("a")), UploadError::kNone);
  chunks_->Delete("s1");
  chunks_->Delete("s1");
  EXPECT_FALSE(chunks_->IsOpen("s1"));
  EXPECT_TRUE(kv_->ListKeys(ChunkStore::ChunkPrefix("s1")).empty());
}

TEST_F(ChunkStoreTest, RestoreRebuildsIndexSetFromStoredKeys) {
  ASSERT_TRUE(chunks_->Open("s1", 3));
  ASSERT_EQ(chunks_->Put("s1", 0, storage::ToBytes("a")), UploadError::kNone);
  ASSERT_EQ(chunks_->Put("s1", 2, storage::ToBytes("c")), UploadError::kNone);

  ChunkStore reopened(kv_);
  reopened.Restore("s1", 3);
  EXPECT_EQ(reopened.ListPresent("s1"), (std::set<int64_t>{0, 2}));
  EXPECT_EQ(reopened.Put("s1", 1, storage::ToBytes("b")), UploadError::kNone);
  EXPECT_EQ(storage::ToString(reopened.Assemble("s1").bytes), "abc");
}

}  // namespace
}  // namespace triptych::upload
