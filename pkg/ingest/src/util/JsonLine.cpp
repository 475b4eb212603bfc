// Repository: Triptych-ingest
// Component: JSON line helpers
// Copyright (c) 2026 Triptych

#include "triptych/util/JsonLine.hpp"

#include <cctype>
#include <stdexcept>

namespace triptych::util {

namespace {

// Returns the offset just past "key": (and any spaces), or npos.
size_t FindValueStart(const std::string& line, const std::string& key, size_t from) {
  std::string search = "\"" + key + "\":";
  size_t start = line.find(search, from);
  if (start == std::string::npos) return std::string::npos;
  start += search.size();
  while (start < line.size() && line[start] == ' ') ++start;
  return start;
}

}  // namespace

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

bool ParseJsonStringValue(const std::string& line, const std::string& key,
                          size_t* pos, std::string* out) {
  size_t start = FindValueStart(line, key, *pos);
  if (start == std::string::npos || start >= line.size() || line[start] != '"') {
    return false;
  }
  ++start;
  out->clear();
  for (size_t i = start; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size()) {
      if (line[i + 1] == '"')  { *out += '"';  i++; continue; }
      if (line[i + 1] == '\\') { *out += '\\'; i++; continue; }
      if (line[i + 1] == 'n')  { *out += '\n'; i++; continue; }
      if (line[i + 1] == 'r')  { *out += '\r'; i++; continue; }
      if (line[i + 1] == 't')  { *out += '\t'; i++; continue; }
    }
    if (line[i] == '"') {
      *pos = i + 1;
      return true;
    }
    *out += line[i];
  }
  return false;
}

bool ParseJsonInt64Value(const std::string& line, const std::string& key,
                         size_t* pos, int64_t* out) {
  size_t start = FindValueStart(line, key, *pos);
  if (start == std::string::npos) return false;
  size_t end = start;
  if (end < line.size() && line[end] == '-') ++end;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) ++end;
  if (end == start) return false;
  try {
    *out = static_cast<int64_t>(std::stoll(line.substr(start, end - start)));
  } catch (const std::logic_error&) {
    return false;
  }
  *pos = end;
  return true;
}

bool ParseJsonUint64Value(const std::string& line, const std::string& key,
                          size_t* pos, uint64_t* out) {
  size_t start = FindValueStart(line, key, *pos);
  if (start == std::string::npos) return false;
  size_t end = start;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) ++end;
  if (end == start) return false;
  try {
    *out = static_cast<uint64_t>(std::stoull(line.substr(start, end - start)));
  } catch (const std::logic_error&) {
    return false;
  }
  *pos = end;
  return true;
}

bool ParseJsonBoolValue(const std::string& line, const std::string& key,
                        size_t* pos, bool* out) {
  size_t start = FindValueStart(line, key, *pos);
  if (start == std::string::npos) return false;
  if (line.compare(start, 4, "true") == 0) {
    *out = true;
    *pos = start + 4;
    return true;
  }
  if (line.compare(start, 5, "false") == 0) {
    *out = false;
    *pos = start + 5;
    return true;
  }
  return false;
}

bool LooksLikeJsonObject(const std::string& line) {
  return !line.empty() && line.front() == '{' && line.back() == '}';
}

}  // namespace triptych::util
