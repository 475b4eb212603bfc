// Repository: Triptych-ingest
// Component: In-memory key-value store
// Copyright (c) 2026 Triptych

#include "triptych/storage/InMemoryKeyValueStore.hpp"

namespace triptych::storage {

bool InMemoryKeyValueStore::Put(const std::string& key, const Bytes& value) {
  if (key.empty()) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
  return true;
}

std::optional<Bytes> InMemoryKeyValueStore::Get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

bool InMemoryKeyValueStore::Delete(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_.erase(key);
  return true;
}

std::vector<std::string> InMemoryKeyValueStore::ListKeys(const std::string& prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

std::string InMemoryKeyValueStore::Locate(const std::string& key) const {
  return "mem://" + key;
}

size_t InMemoryKeyValueStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.size();
}

}  // namespace triptych::storage
