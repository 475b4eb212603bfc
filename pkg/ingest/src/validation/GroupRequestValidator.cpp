// Repository: Triptych-ingest
// Component: Group Request Validator
// Copyright (c) 2026 Triptych

#include "triptych/validation/GroupRequestValidator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace triptych::validation {

namespace {

std::string Lower(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

void Add(std::vector<ValidationIssue>* issues, const std::string& field, int32_t index,
         const std::string& message) {
  issues->push_back(ValidationIssue{field, index, message});
}

void CheckSize(int64_t size, int32_t index, const upload::UploadLimits& limits,
               std::vector<ValidationIssue>* issues) {
  if (size <= 0) {
    Add(issues, "sizes", index, "must be > 0");
  } else if (size > limits.max_file_size_bytes) {
    std::ostringstream oss;
    oss << "exceeds max file size " << limits.max_file_size_bytes << " bytes";
    Add(issues, "sizes", index, oss.str());
  }
}

void CheckDuration(int64_t duration_ms, int32_t index, const upload::UploadLimits& limits,
                   std::vector<ValidationIssue>* issues) {
  if (duration_ms < limits.min_duration_ms || duration_ms > limits.max_duration_ms) {
    std::ostringstream oss;
    oss << "must be within [" << limits.min_duration_ms << ", "
        << limits.max_duration_ms << "] ms";
    Add(issues, "durations", index, oss.str());
  }
}

void CheckMime(const std::string& mime_type, int32_t index, const upload::UploadLimits& limits,
               std::vector<ValidationIssue>* issues) {
  if (!IsAllowedMimeType(mime_type, limits)) {
    Add(issues, "mime_types", index, "unsupported type '" + mime_type + "'");
  }
}

void CheckChunkCount(const upload::VideoDeclaration& video, int32_t index,
                     const upload::UploadLimits& limits,
                     std::vector<ValidationIssue>* issues) {
  if (video.declared_size <= 0) return;  // reported by CheckSize
  const int64_t expected = upload::ExpectedChunkCount(video.declared_size, limits.chunk_size_bytes);
  if (video.declared_chunk_count != expected) {
    std::ostringstream oss;
    oss << "expected " << expected << " chunks of " << limits.chunk_size_bytes
        << " bytes, got " << video.declared_chunk_count;
    Add(issues, "chunk_counts", index, oss.str());
  }
}

// SHA-256 hex: 64 hex digits, either case.
void CheckDeclaredHash(const upload::VideoDeclaration& video, int32_t index,
                       std::vector<ValidationIssue>* issues) {
  if (!video.declared_hash || video.declared_hash->empty()) return;
  const std::string& hash = *video.declared_hash;
  const bool hex = std::all_of(hash.begin(), hash.end(),
                               [](unsigned char c) { return std::isxdigit(c) != 0; });
  if (hash.size() != 64 || !hex) {
    Add(issues, "hashes", index, "must be 64 hex digits (SHA-256)");
  }
}

}  // namespace

bool IsAllowedMimeType(const std::string& mime_type, const upload::UploadLimits& limits) {
  const std::string lowered = Lower(mime_type);
  for (const auto& allowed : limits.allowed_mime_types) {
    if (lowered == Lower(allowed)) return true;
  }
  return false;
}

std::vector<ValidationIssue> ValidateGroupRequest(
    size_t n,
    const std::vector<int64_t>& sizes,
    const std::vector<std::string>& mime_types,
    const std::vector<int64_t>& durations,
    const upload::UploadLimits& limits) {
  std::vector<ValidationIssue> issues;

  if (n != static_cast<size_t>(upload::kStatementsPerGroup)) {
    std::ostringstream oss;
    oss << "expected exactly " << upload::kStatementsPerGroup << " videos, got " << n;
    Add(&issues, "count", -1, oss.str());
  }

  auto check_length = [&](const char* field, size_t length) {
    if (length != n) {
      std::ostringstream oss;
      oss << "has " << length << " entries, expected " << n;
      Add(&issues, field, -1, oss.str());
    }
  };
  check_length("sizes", sizes.size());
  check_length("mime_types", mime_types.size());
  check_length("durations", durations.size());

  // Totals only count entries that passed their own range check, so the
  // sums stay bounded by n times the per-item maximum.
  int64_t total_size = 0;
  for (size_t i = 0; i < sizes.size(); ++i) {
    CheckSize(sizes[i], static_cast<int32_t>(i), limits, &issues);
    if (sizes[i] > 0 && sizes[i] <= limits.max_file_size_bytes) total_size += sizes[i];
  }
  for (size_t i = 0; i < mime_types.size(); ++i) {
    CheckMime(mime_types[i], static_cast<int32_t>(i), limits, &issues);
  }
  int64_t total_duration = 0;
  for (size_t i = 0; i < durations.size(); ++i) {
    CheckDuration(durations[i], static_cast<int32_t>(i), limits, &issues);
    if (durations[i] >= limits.min_duration_ms && durations[i] <= limits.max_duration_ms) {
      total_duration += durations[i];
    }
  }

  const int64_t slots = static_cast<int64_t>(upload::kStatementsPerGroup);
  if (total_size > slots * limits.max_file_size_bytes) {
    std::ostringstream oss;
    oss << "total size " << total_size << " exceeds " << slots * limits.max_file_size_bytes;
    Add(&issues, "total_size", -1, oss.str());
  }
  if (total_duration > slots * limits.max_duration_ms) {
    std::ostringstream oss;
    oss << "total duration " << total_duration << " ms exceeds "
        << slots * limits.max_duration_ms << " ms";
    Add(&issues, "total_duration", -1, oss.str());
  }
  return issues;
}

std::vector<ValidationIssue> ValidateVideoDeclaration(
    const upload::VideoDeclaration& video,
    const upload::UploadLimits& limits,
    int32_t index) {
  std::vector<ValidationIssue> issues;
  CheckSize(video.declared_size, index, limits, &issues);
  CheckMime(video.mime_type, index, limits, &issues);
  CheckDuration(video.declared_duration_ms, index, limits, &issues);
  CheckChunkCount(video, index, limits, &issues);
  CheckDeclaredHash(video, index, &issues);
  return issues;
}

std::vector<ValidationIssue> ValidateGroupDeclarations(
    const std::vector<upload::VideoDeclaration>& videos,
    const upload::UploadLimits& limits) {
  std::vector<int64_t> sizes;
  std::vector<std::string> mime_types;
  std::vector<int64_t> durations;
  for (const auto& v : videos) {
    sizes.push_back(v.declared_size);
    mime_types.push_back(v.mime_type);
    durations.push_back(v.declared_duration_ms);
  }
  auto issues = ValidateGroupRequest(videos.size(), sizes, mime_types, durations, limits);
  for (size_t i = 0; i < videos.size(); ++i) {
    CheckChunkCount(videos[i], static_cast<int32_t>(i), limits, &issues);
    CheckDeclaredHash(videos[i], static_cast<int32_t>(i), &issues);
  }
  return issues;
}

std::string FormatIssues(const std::vector<ValidationIssue>& issues) {
  std::ostringstream oss;
  for (size_t i = 0; i < issues.size(); ++i) {
    if (i > 0) oss << "; ";
    oss << issues[i].field;
    if (issues[i].index >= 0) oss << "[" << issues[i].index << "]";
    oss << ": " << issues[i].message;
  }
  return oss.str();
}

}  // namespace triptych::validation
