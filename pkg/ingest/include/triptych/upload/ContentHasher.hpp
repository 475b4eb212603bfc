// Repository: Triptych-ingest
// Component: Content hasher
// Purpose: SHA-256 digests for assembled videos and individual chunks.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UPLOAD_CONTENT_HASHER_HPP_
#define TRIPTYCH_UPLOAD_CONTENT_HASHER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace triptych::upload {

// Lowercase hex SHA-256 of data; empty string if the digest could not be
// computed.
std::string Sha256Hex(const uint8_t* data, size_t length);

inline std::string Sha256Hex(const std::vector<uint8_t>& data) {
  return Sha256Hex(data.data(), data.size());
}

// Case-insensitive comparison of two hex digests. Empty never matches.
bool DigestsMatch(const std::string& a, const std::string& b);

}  // namespace triptych::upload

#endif  // TRIPTYCH_UPLOAD_CONTENT_HASHER_HPP_
