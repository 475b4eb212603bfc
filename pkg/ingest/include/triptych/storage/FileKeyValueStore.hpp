// Repository: Triptych-ingest
// Component: Filesystem key-value store
// Purpose: One file per key under a root directory. Keys map to relative
//          paths ("chunks/<session>/000003" -> <root>/chunks/<session>/000003).
//          Writes go to a temp file and are renamed into place.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_STORAGE_FILE_KEY_VALUE_STORE_HPP_
#define TRIPTYCH_STORAGE_FILE_KEY_VALUE_STORE_HPP_

#include <atomic>
#include <string>

#include "triptych/storage/IKeyValueStore.hpp"

namespace triptych::storage {

class FileKeyValueStore : public IKeyValueStore {
 public:
  // Creates root_dir if missing; throws std::runtime_error if it cannot.
  explicit FileKeyValueStore(std::string root_dir);

  FileKeyValueStore(const FileKeyValueStore&) = delete;
  FileKeyValueStore& operator=(const FileKeyValueStore&) = delete;

  bool Put(const std::string& key, const Bytes& value) override;
  std::optional<Bytes> Get(const std::string& key) const override;
  bool Delete(const std::string& key) override;
  std::vector<std::string> ListKeys(const std::string& prefix) const override;
  std::string Locate(const std::string& key) const override;

  const std::string& RootDir() const { return root_dir_; }

  // Rejects empty keys, absolute keys, empty / "." / ".." components and
  // names reserved for in-flight temp files.
  static bool IsValidKey(const std::string& key);

 private:
  std::string PathFor(const std::string& key) const;

  std::string root_dir_;
  std::atomic<uint64_t> temp_counter_{0};
};

}  // namespace triptych::storage

#endif  // TRIPTYCH_STORAGE_FILE_KEY_VALUE_STORE_HPP_
