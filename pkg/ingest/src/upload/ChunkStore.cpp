// Repository: Triptych-ingest
// Component: Chunk Store
// Copyright (c) 2026 Triptych

#include "triptych/upload/ChunkStore.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "triptych/util/Logger.hpp"

namespace triptych::upload {

using triptych::util::Logger;

ChunkStore::ChunkStore(std::shared_ptr<storage::IKeyValueStore> store)
    : store_(std::move(store)) {}

std::string ChunkStore::ChunkPrefix(const std::string& session_id) {
  return "chunks/" + session_id + "/";
}

std::string ChunkStore::ChunkKey(const std::string& session_id, int64_t index) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%06lld", static_cast<long long>(index));
  return ChunkPrefix(session_id) + buf;
}

std::shared_ptr<ChunkStore::SessionChunks> ChunkStore::Find(
    const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

bool ChunkStore::Open(const std::string& session_id, int64_t chunk_count) {
  if (chunk_count <= 0) return false;
  std::lock_guard<std::mutex> lock(registry_mutex_);
  if (sessions_.count(session_id) != 0) return false;
  auto entry = std::make_shared<SessionChunks>();
  entry->chunk_count = chunk_count;
  sessions_.emplace(session_id, std::move(entry));
  return true;
}

bool ChunkStore::IsOpen(const std::string& session_id) const {
  return Find(session_id) != nullptr;
}

UploadError ChunkStore::Put(const std::string& session_id, int64_t index,
                            const Bytes& bytes) {
  auto entry = Find(session_id);
  if (!entry) return UploadError::kNotFound;

  bool duplicate = false;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (index < 0 || index >= entry->chunk_count) {
      return UploadError::kIndexOutOfRange;
    }
    duplicate = entry->present.count(index) != 0;
  }

  // The KV write happens outside the index lock so sibling indices proceed
  // in parallel.
  if (!store_->Put(ChunkKey(session_id, index), bytes)) {
    std::ostringstream oss;
    oss << "[ChunkStore] CHUNK_WRITE_FAILED session=" << session_id
        << " index=" << index << " bytes=" << bytes.size();
    Logger::Warn(oss.str());
    return UploadError::kStorageError;
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->present.insert(index);
  return duplicate ? UploadError::kDuplicate : UploadError::kNone;
}

std::set<int64_t> ChunkStore::ListPresent(const std::string& session_id) const {
  auto entry = Find(session_id);
  if (!entry) return {};
  std::lock_guard<std::mutex> lock(entry->mutex);
  return entry->present;
}

ChunkStore::AssembleResult ChunkStore::Assemble(const std::string& session_id) const {
  AssembleResult result;
  auto entry = Find(session_id);
  if (!entry) {
    result.error = UploadError::kNotFound;
    return result;
  }

  int64_t chunk_count = 0;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    chunk_count = entry->chunk_count;
    for (int64_t i = 0; i < chunk_count; ++i) {
      if (entry->present.count(i) == 0) result.missing_indices.push_back(i);
    }
  }
  if (!result.missing_indices.empty()) {
    result.error = UploadError::kIncomplete;
    return result;
  }

  for (int64_t i = 0; i < chunk_count; ++i) {
    auto chunk = store_->Get(ChunkKey(session_id, i));
    if (!chunk) {
      std::ostringstream oss;
      oss << "[ChunkStore] CHUNK_READ_FAILED session=" << session_id << " index=" << i;
      Logger::Warn(oss.str());
      result.bytes.clear();
      result.error = UploadError::kStorageError;
      return result;
    }
    result.bytes.insert(result.bytes.end(), chunk->begin(), chunk->end());
  }
  result.ok = true;
  return result;
}

void ChunkStore::Delete(const std::string& session_id) {
  std::shared_ptr<SessionChunks> entry;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
      entry = it->second;
      sessions_.erase(it);
    }
  }
  if (entry) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->present.clear();
  }
  // Keys are listed from the store rather than the index set so chunks left
  // behind by a crash are removed too.
  for (const auto& key : store_->ListKeys(ChunkPrefix(session_id))) {
    if (!store_->Delete(key)) {
      Logger::Warn("[ChunkStore] CHUNK_DELETE_FAILED key=" + key);
    }
  }
}

void ChunkStore::Restore(const std::string& session_id, int64_t chunk_count) {
  auto entry = std::make_shared<SessionChunks>();
  entry->chunk_count = chunk_count;
  const std::string prefix = ChunkPrefix(session_id);
  for (const auto& key : store_->ListKeys(prefix)) {
    const std::string suffix = key.substr(prefix.size());
    char* end = nullptr;
    long long index = std::strtoll(suffix.c_str(), &end, 10);
    if (suffix.empty() || end == nullptr || *end != '\0') continue;
    if (index >= 0 && index < chunk_count) entry->present.insert(index);
  }
  std::lock_guard<std::mutex> lock(registry_mutex_);
  sessions_[session_id] = std::move(entry);
}

}  // namespace triptych::upload
