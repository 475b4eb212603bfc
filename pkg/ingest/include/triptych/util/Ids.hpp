// Repository: Triptych-ingest
// Component: Identifier and timestamp helpers
// Purpose: Random session/group ids and UTC timestamp formatting.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UTIL_IDS_HPP_
#define TRIPTYCH_UTIL_IDS_HPP_

#include <cstdint>
#include <string>

namespace triptych::util {

// RFC 4122 version 4 UUID, lowercase hex with dashes.
std::string GenerateUuidV4();

// "2026-01-31T12:00:00.000Z"; empty string if the value cannot be formatted.
std::string FormatUtcIso8601(int64_t utc_ms);

}  // namespace triptych::util

#endif  // TRIPTYCH_UTIL_IDS_HPP_
