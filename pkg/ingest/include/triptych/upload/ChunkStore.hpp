// Repository: Triptych-ingest
// Component: Chunk Store
// Purpose: Raw chunk bytes per (session, index) on top of the key-value
//          store, plus the per-session set of received indices.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UPLOAD_CHUNK_STORE_HPP_
#define TRIPTYCH_UPLOAD_CHUNK_STORE_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "triptych/storage/IKeyValueStore.hpp"
#include "triptych/upload/UploadTypes.hpp"

namespace triptych::upload {

using storage::Bytes;

// ChunkStore: append-only chunk persistence.
//
// Writes for different indices of the same session may run concurrently;
// only the index-set bookkeeping is serialized, per session. A write to an
// index that is already present replaces the bytes (last write wins) and
// reports kDuplicate, which callers treat as an idempotent success.
class ChunkStore {
 public:
  struct AssembleResult {
    bool ok = false;
    UploadError error = UploadError::kNone;
    Bytes bytes;
    std::vector<int64_t> missing_indices;
  };

  explicit ChunkStore(std::shared_ptr<storage::IKeyValueStore> store);

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;

  // Registers a session's index space [0, chunk_count). Returns false if the
  // session is already open or chunk_count is not positive.
  bool Open(const std::string& session_id, int64_t chunk_count);

  // kNone, kDuplicate, kIndexOutOfRange, kNotFound or kStorageError.
  UploadError Put(const std::string& session_id, int64_t index, const Bytes& bytes);

  std::set<int64_t> ListPresent(const std::string& session_id) const;

  // Concatenates all chunks in index order. kIncomplete (with the missing
  // indices), kNotFound, or kStorageError if a present chunk cannot be read.
  AssembleResult Assemble(const std::string& session_id) const;

  // Removes every stored chunk and forgets the session. Idempotent.
  void Delete(const std::string& session_id);

  // Re-registers a session and rebuilds its index set from stored keys.
  void Restore(const std::string& session_id, int64_t chunk_count);

  bool IsOpen(const std::string& session_id) const;

  static std::string ChunkKey(const std::string& session_id, int64_t index);
  static std::string ChunkPrefix(const std::string& session_id);

 private:
  struct SessionChunks {
    std::mutex mutex;
    int64_t chunk_count = 0;
    std::set<int64_t> present;
  };

  std::shared_ptr<SessionChunks> Find(const std::string& session_id) const;

  std::shared_ptr<storage::IKeyValueStore> store_;

  // Guards the map only; each SessionChunks carries its own mutex.
  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionChunks>> sessions_;
};

}  // namespace triptych::upload

#endif  // TRIPTYCH_UPLOAD_CHUNK_STORE_HPP_
