// Repository: Triptych-ingest
// Component: In-memory key-value store
// Purpose: Process-local IKeyValueStore for tests and ephemeral deployments.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_STORAGE_IN_MEMORY_KEY_VALUE_STORE_HPP_
#define TRIPTYCH_STORAGE_IN_MEMORY_KEY_VALUE_STORE_HPP_

#include <map>
#include <mutex>

#include "triptych/storage/IKeyValueStore.hpp"

namespace triptych::storage {

class InMemoryKeyValueStore : public IKeyValueStore {
 public:
  InMemoryKeyValueStore() = default;

  bool Put(const std::string& key, const Bytes& value) override;
  std::optional<Bytes> Get(const std::string& key) const override;
  bool Delete(const std::string& key) override;
  std::vector<std::string> ListKeys(const std::string& prefix) const override;
  std::string Locate(const std::string& key) const override;

  size_t Size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Bytes> values_;
};

}  // namespace triptych::storage

#endif  // TRIPTYCH_STORAGE_IN_MEMORY_KEY_VALUE_STORE_HPP_
