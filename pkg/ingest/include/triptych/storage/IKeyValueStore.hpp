// Repository: Triptych-ingest
// Component: Key-value storage seam
// Purpose: Single-key atomic byte storage backing chunks, assembled sources
//          and persisted session/group records.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_STORAGE_IKEY_VALUE_STORE_HPP_
#define TRIPTYCH_STORAGE_IKEY_VALUE_STORE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace triptych::storage {

using Bytes = std::vector<uint8_t>;

// No transactions beyond single-key atomicity. Implementations must be safe
// for concurrent calls on different keys.
class IKeyValueStore {
 public:
  virtual ~IKeyValueStore() = default;

  // Returns false if the value could not be stored (key rejected, I/O error).
  virtual bool Put(const std::string& key, const Bytes& value) = 0;

  virtual std::optional<Bytes> Get(const std::string& key) const = 0;

  // Deleting an absent key succeeds.
  virtual bool Delete(const std::string& key) = 0;

  // All keys starting with prefix, sorted ascending.
  virtual std::vector<std::string> ListKeys(const std::string& prefix) const = 0;

  // Locator handed to the media collaborator for a stored value
  // (a filesystem path for FileKeyValueStore).
  virtual std::string Locate(const std::string& key) const = 0;
};

inline Bytes ToBytes(const std::string& s) {
  return Bytes(s.begin(), s.end());
}

inline std::string ToString(const Bytes& b) {
  return std::string(b.begin(), b.end());
}

}  // namespace triptych::storage

#endif  // TRIPTYCH_STORAGE_IKEY_VALUE_STORE_HPP_
