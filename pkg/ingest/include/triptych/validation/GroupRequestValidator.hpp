// Repository: Triptych-ingest
// Component: Group Request Validator
// Purpose: Request-level checks run before any session is created.
//          Pure functions; every violation is reported, not just the first.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_VALIDATION_GROUP_REQUEST_VALIDATOR_HPP_
#define TRIPTYCH_VALIDATION_GROUP_REQUEST_VALIDATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "triptych/upload/UploadConfig.hpp"
#include "triptych/upload/UploadTypes.hpp"

namespace triptych::validation {

struct ValidationIssue {
  std::string field;    // "count", "sizes", "durations", "mime_types", ...
  int32_t index = -1;   // position in the request arrays, -1 for request-wide
  std::string message;
};

// Rules:
//   n == kStatementsPerGroup
//   sizes, mime_types and durations all have length n
//   each size in (0, max_file_size_bytes]
//   each duration in [min_duration_ms, max_duration_ms]
//   each MIME type in allowed_mime_types (case-insensitive)
//   sum of sizes <= n * max_file_size_bytes, sum of durations <= n * max_duration_ms
std::vector<ValidationIssue> ValidateGroupRequest(
    size_t n,
    const std::vector<int64_t>& sizes,
    const std::vector<std::string>& mime_types,
    const std::vector<int64_t>& durations,
    const upload::UploadLimits& limits);

// Single-video checks shared by session creation: size, duration, MIME type
// and declared_chunk_count == ceil(size / chunk_size). `index` labels the
// issues; pass -1 for a standalone session.
std::vector<ValidationIssue> ValidateVideoDeclaration(
    const upload::VideoDeclaration& video,
    const upload::UploadLimits& limits,
    int32_t index = -1);

// ValidateGroupRequest over the declarations plus the per-video chunk count
// check.
std::vector<ValidationIssue> ValidateGroupDeclarations(
    const std::vector<upload::VideoDeclaration>& videos,
    const upload::UploadLimits& limits);

bool IsAllowedMimeType(const std::string& mime_type, const upload::UploadLimits& limits);

// "sizes[1]: must be > 0; count: expected 3 videos, got 2"
std::string FormatIssues(const std::vector<ValidationIssue>& issues);

}  // namespace triptych::validation

#endif  // TRIPTYCH_VALIDATION_GROUP_REQUEST_VALIDATOR_HPP_
