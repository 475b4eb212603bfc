// Repository: Triptych-ingest
// Component: Merge Types
// Copyright (c) 2026 Triptych

#include "triptych/merge/MergeTypes.hpp"

#include <algorithm>
#include <sstream>

#include "triptych/util/JsonLine.hpp"

namespace triptych::merge {

using triptych::util::JsonEscape;
using triptych::util::ParseJsonBoolValue;
using triptych::util::ParseJsonInt64Value;
using triptych::util::ParseJsonStringValue;

namespace {

constexpr size_t kMaxMergeMessageLength = 200;

}  // namespace

const char* GroupStatusName(GroupStatus status) {
  switch (status) {
    case GroupStatus::kAwaitingUploads: return "awaiting_uploads";
    case GroupStatus::kMerging:         return "merging";
    case GroupStatus::kCompleted:       return "completed";
    case GroupStatus::kFailed:          return "failed";
    case GroupStatus::kCancelled:       return "cancelled";
  }
  return "unknown";
}

bool ParseGroupStatus(const std::string& name, GroupStatus* out) {
  static const GroupStatus kAll[] = {
      GroupStatus::kAwaitingUploads, GroupStatus::kMerging, GroupStatus::kCompleted,
      GroupStatus::kFailed, GroupStatus::kCancelled};
  for (GroupStatus s : kAll) {
    if (name == GroupStatusName(s)) {
      *out = s;
      return true;
    }
  }
  return false;
}

const char* MergeOutcomeKindName(MergeOutcome::Kind kind) {
  switch (kind) {
    case MergeOutcome::Kind::kSucceeded: return "succeeded";
    case MergeOutcome::Kind::kFailed:    return "failed";
    case MergeOutcome::Kind::kCancelled: return "cancelled";
  }
  return "unknown";
}

std::string CheckMergeResult(const MergeJob& job, const MergeResult& result) {
  if (result.output_locator.empty()) return "empty output locator";
  if (result.segments.size() != job.sources.size()) {
    return "expected " + std::to_string(job.sources.size()) + " segments, got " +
           std::to_string(result.segments.size());
  }
  std::vector<SegmentTiming> ordered = result.segments;
  std::sort(ordered.begin(), ordered.end(), [](const SegmentTiming& a, const SegmentTiming& b) {
    return a.statement_index < b.statement_index;
  });
  int64_t previous_end = 0;
  for (size_t i = 0; i < ordered.size(); ++i) {
    const SegmentTiming& seg = ordered[i];
    if (seg.statement_index != job.sources[i].statement_index) {
      return "segment statement indices do not match the sources";
    }
    if (seg.start_offset_ms < previous_end) {
      return "segment " + std::to_string(seg.statement_index) + " overlaps its predecessor";
    }
    if (seg.end_offset_ms <= seg.start_offset_ms) {
      return "segment " + std::to_string(seg.statement_index) + " has an empty span";
    }
    previous_end = seg.end_offset_ms;
  }
  return "";
}

std::string SanitizeMergeMessage(const std::string& message) {
  const size_t eol = message.find_first_of("\r\n");
  std::istringstream words(message.substr(0, eol));
  std::string word;
  std::string out;
  while (words >> word) {
    if (word.find('/') != std::string::npos || word.find('\\') != std::string::npos) {
      word = "<path>";
    }
    if (!out.empty()) out += ' ';
    out += word;
  }
  if (out.size() > kMaxMergeMessageLength) {
    out.resize(kMaxMergeMessageLength);
  }
  if (out.empty()) out = "merge failed";
  return out;
}

// Slots and segments are flattened into numbered keys so the record stays a
// single flat JSON object readable by the ordered key parser.
std::string MergeGroupRecord::ToJsonLine() const {
  std::ostringstream o;
  o << "{\"group_id\":\"" << JsonEscape(group_id) << "\""
    << ",\"owner_id\":\"" << JsonEscape(owner_id) << "\"";
  for (size_t i = 0; i < slots.size(); ++i) {
    o << ",\"slot" << i << "_session_id\":\"" << JsonEscape(slots[i].session_id) << "\""
      << ",\"slot" << i << "_ready\":" << (slots[i].ready ? "true" : "false");
  }
  o << ",\"status\":\"" << GroupStatusName(status) << "\""
    << ",\"merge_triggered\":" << (merge_triggered ? "true" : "false")
    << ",\"merge_progress_percent\":" << merge_progress_percent
    << ",\"has_result\":" << (has_result ? "true" : "false")
    << ",\"output_locator\":\"" << JsonEscape(result.output_locator) << "\""
    << ",\"total_duration_ms\":" << result.total_duration_ms
    << ",\"segment_count\":" << result.segments.size();
  for (size_t i = 0; i < result.segments.size(); ++i) {
    const auto& seg = result.segments[i];
    o << ",\"seg" << i << "_statement_index\":" << seg.statement_index
      << ",\"seg" << i << "_start_offset_ms\":" << seg.start_offset_ms
      << ",\"seg" << i << "_end_offset_ms\":" << seg.end_offset_ms;
  }
  o << ",\"error_code\":\"" << JsonEscape(error_code) << "\""
    << ",\"error_message\":\"" << JsonEscape(error_message) << "\""
    << ",\"created_utc_ms\":" << created_utc_ms
    << ",\"updated_utc_ms\":" << updated_utc_ms
    << ",\"triggered_utc_ms\":" << triggered_utc_ms
    << ",\"finished_utc_ms\":" << finished_utc_ms
    << "}";
  return o.str();
}

bool MergeGroupRecord::FromJsonLine(const std::string& line, MergeGroupRecord& out) {
  if (!util::LooksLikeJsonObject(line)) return false;
  size_t pos = 0;
  if (!ParseJsonStringValue(line, "group_id", &pos, &out.group_id)) return false;
  if (!ParseJsonStringValue(line, "owner_id", &pos, &out.owner_id)) return false;
  for (size_t i = 0; i < out.slots.size(); ++i) {
    const std::string prefix = "slot" + std::to_string(i);
    if (!ParseJsonStringValue(line, prefix + "_session_id", &pos, &out.slots[i].session_id)) {
      return false;
    }
    if (!ParseJsonBoolValue(line, prefix + "_ready", &pos, &out.slots[i].ready)) return false;
  }
  std::string status_name;
  if (!ParseJsonStringValue(line, "status", &pos, &status_name)) return false;
  if (!ParseGroupStatus(status_name, &out.status)) return false;
  if (!ParseJsonBoolValue(line, "merge_triggered", &pos, &out.merge_triggered)) return false;
  int64_t progress = 0;
  if (!ParseJsonInt64Value(line, "merge_progress_percent", &pos, &progress)) return false;
  out.merge_progress_percent = static_cast<int32_t>(progress);
  if (!ParseJsonBoolValue(line, "has_result", &pos, &out.has_result)) return false;
  if (!ParseJsonStringValue(line, "output_locator", &pos, &out.result.output_locator)) return false;
  if (!ParseJsonInt64Value(line, "total_duration_ms", &pos, &out.result.total_duration_ms)) {
    return false;
  }
  int64_t segment_count = 0;
  if (!ParseJsonInt64Value(line, "segment_count", &pos, &segment_count)) return false;
  if (segment_count < 0) return false;
  out.result.segments.clear();
  for (int64_t i = 0; i < segment_count; ++i) {
    const std::string prefix = "seg" + std::to_string(i);
    SegmentTiming seg;
    int64_t statement_index = -1;
    if (!ParseJsonInt64Value(line, prefix + "_statement_index", &pos, &statement_index)) {
      return false;
    }
    seg.statement_index = static_cast<int32_t>(statement_index);
    if (!ParseJsonInt64Value(line, prefix + "_start_offset_ms", &pos, &seg.start_offset_ms)) {
      return false;
    }
    if (!ParseJsonInt64Value(line, prefix + "_end_offset_ms", &pos, &seg.end_offset_ms)) {
      return false;
    }
    out.result.segments.push_back(seg);
  }
  if (!ParseJsonStringValue(line, "error_code", &pos, &out.error_code)) return false;
  if (!ParseJsonStringValue(line, "error_message", &pos, &out.error_message)) return false;
  if (!ParseJsonInt64Value(line, "created_utc_ms", &pos, &out.created_utc_ms)) return false;
  if (!ParseJsonInt64Value(line, "updated_utc_ms", &pos, &out.updated_utc_ms)) return false;
  if (!ParseJsonInt64Value(line, "triggered_utc_ms", &pos, &out.triggered_utc_ms)) return false;
  if (!ParseJsonInt64Value(line, "finished_utc_ms", &pos, &out.finished_utc_ms)) return false;
  return true;
}

}  // namespace triptych::merge
