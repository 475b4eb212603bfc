// Repository: Triptych-ingest
// Component: JSON line helpers
// Purpose: Minimal single-line JSON writing/reading for persisted records
//          and the event journal. Fields are read in the order written.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UTIL_JSON_LINE_HPP_
#define TRIPTYCH_UTIL_JSON_LINE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace triptych::util {

std::string JsonEscape(const std::string& s);

// Each parser looks for "key": at or after *pos. On success the value is
// stored in *out, *pos is advanced past it and true is returned.
bool ParseJsonStringValue(const std::string& line, const std::string& key,
                          size_t* pos, std::string* out);
bool ParseJsonInt64Value(const std::string& line, const std::string& key,
                         size_t* pos, int64_t* out);
bool ParseJsonUint64Value(const std::string& line, const std::string& key,
                          size_t* pos, uint64_t* out);
bool ParseJsonBoolValue(const std::string& line, const std::string& key,
                        size_t* pos, bool* out);

// Cheap structural check: non-empty, starts with '{' and ends with '}'.
bool LooksLikeJsonObject(const std::string& line);

}  // namespace triptych::util

#endif  // TRIPTYCH_UTIL_JSON_LINE_HPP_
