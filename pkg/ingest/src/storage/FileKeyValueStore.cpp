// Repository: Triptych-ingest
// Component: Filesystem key-value store
// Copyright (c) 2026 Triptych

#include "triptych/storage/FileKeyValueStore.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

#include "triptych/util/Logger.hpp"

namespace triptych::storage {

namespace fs = std::filesystem;
using triptych::util::Logger;

namespace {

constexpr char kTempMarker[] = ".tmp.";

}  // namespace

FileKeyValueStore::FileKeyValueStore(std::string root_dir)
    : root_dir_(std::move(root_dir)) {
  while (root_dir_.size() > 1 && root_dir_.back() == '/') root_dir_.pop_back();
  std::error_code ec;
  fs::create_directories(root_dir_, ec);
  if (ec || !fs::is_directory(root_dir_)) {
    throw std::runtime_error("FileKeyValueStore: cannot create directory " + root_dir_);
  }
}

bool FileKeyValueStore::IsValidKey(const std::string& key) {
  if (key.empty() || key.front() == '/' || key.back() == '/') return false;
  if (key.find(kTempMarker) != std::string::npos) return false;
  size_t start = 0;
  while (start <= key.size()) {
    size_t slash = key.find('/', start);
    if (slash == std::string::npos) slash = key.size();
    const std::string part = key.substr(start, slash - start);
    if (part.empty() || part == "." || part == "..") return false;
    start = slash + 1;
  }
  return true;
}

std::string FileKeyValueStore::PathFor(const std::string& key) const {
  return root_dir_ + "/" + key;
}

bool FileKeyValueStore::Put(const std::string& key, const Bytes& value) {
  if (!IsValidKey(key)) {
    Logger::Warn("[FileKeyValueStore] PUT_REJECTED key=" + key);
    return false;
  }
  const std::string path = PathFor(key);
  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) {
    Logger::Warn("[FileKeyValueStore] MKDIR_FAILED key=" + key + " error=" + ec.message());
    return false;
  }

  std::ostringstream tmp;
  tmp << path << kTempMarker << static_cast<unsigned long>(getpid()) << "."
      << temp_counter_.fetch_add(1, std::memory_order_relaxed);
  const std::string tmp_path = tmp.str();
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!of) {
      // A concurrent Delete may have pruned the parent directory.
      fs::create_directories(fs::path(path).parent_path(), ec);
      of.clear();
      of.open(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    }
    if (!of) {
      Logger::Warn("[FileKeyValueStore] OPEN_FAILED key=" + key);
      return false;
    }
    if (!value.empty()) {
      of.write(reinterpret_cast<const char*>(value.data()),
               static_cast<std::streamsize>(value.size()));
    }
    of.flush();
    if (!of) {
      of.close();
      (void)::unlink(tmp_path.c_str());
      Logger::Warn("[FileKeyValueStore] WRITE_FAILED key=" + key);
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const int err = errno;
    (void)::unlink(tmp_path.c_str());
    Logger::Warn("[FileKeyValueStore] RENAME_FAILED key=" + key +
                 " errno=" + std::to_string(err));
    return false;
  }
  return true;
}

std::optional<Bytes> FileKeyValueStore::Get(const std::string& key) const {
  if (!IsValidKey(key)) return std::nullopt;
  std::ifstream in(PathFor(key), std::ios::in | std::ios::binary);
  if (!in) return std::nullopt;
  Bytes out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return out;
}

bool FileKeyValueStore::Delete(const std::string& key) {
  if (!IsValidKey(key)) return false;
  const std::string path = PathFor(key);
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    const int err = errno;
    Logger::Warn("[FileKeyValueStore] DELETE_FAILED key=" + key +
                 " errno=" + std::to_string(err));
    return false;
  }
  // Prune the parent directory once its last key is gone; non-empty
  // directories make remove() fail, which is expected here.
  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (parent != fs::path(root_dir_)) {
    fs::remove(parent, ec);
  }
  return true;
}

std::vector<std::string> FileKeyValueStore::ListKeys(const std::string& prefix) const {
  std::vector<std::string> keys;
  const size_t last_slash = prefix.rfind('/');
  const std::string dir_part =
      last_slash == std::string::npos ? "" : prefix.substr(0, last_slash);
  const fs::path base = dir_part.empty() ? fs::path(root_dir_) : fs::path(PathFor(dir_part));

  std::error_code ec;
  if (!fs::is_directory(base, ec)) return keys;

  const fs::path root(root_dir_);
  for (fs::recursive_directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    std::string rel = it->path().lexically_relative(root).generic_string();
    if (rel.find(kTempMarker) != std::string::npos) continue;
    if (rel.compare(0, prefix.size(), prefix) != 0) continue;
    keys.push_back(std::move(rel));
  }
  if (ec) {
    Logger::Warn("[FileKeyValueStore] LIST_FAILED prefix=" + prefix + " error=" + ec.message());
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::string FileKeyValueStore::Locate(const std::string& key) const {
  return PathFor(key);
}

}  // namespace triptych::storage
