// Repository: Triptych-ingest
// Component: Merge Types
// Purpose: Group status, merge job and result shapes, merge outcome,
//          cancellation token and the persisted group record.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_MERGE_MERGE_TYPES_HPP_
#define TRIPTYCH_MERGE_MERGE_TYPES_HPP_

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "triptych/upload/UploadConfig.hpp"

namespace triptych::merge {

// =============================================================================
// Group Status
// awaiting_uploads -> merging -> completed | failed
// awaiting_uploads | merging -> cancelled
// =============================================================================

enum class GroupStatus {
  kAwaitingUploads,
  kMerging,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* GroupStatusName(GroupStatus status);
bool ParseGroupStatus(const std::string& name, GroupStatus* out);

inline bool IsTerminal(GroupStatus status) {
  return status == GroupStatus::kCompleted ||
         status == GroupStatus::kFailed ||
         status == GroupStatus::kCancelled;
}

// =============================================================================
// Merge job and result
// =============================================================================

// Offsets are milliseconds from the start of the merged output.
struct SegmentTiming {
  int32_t statement_index = -1;
  int64_t start_offset_ms = 0;
  int64_t end_offset_ms = 0;
};

struct MergeResult {
  std::string output_locator;
  int64_t total_duration_ms = 0;
  std::vector<SegmentTiming> segments;  // ordered by statement_index
};

struct MergeSource {
  int32_t statement_index = -1;
  std::string session_id;
  std::string locator;  // IKeyValueStore::Locate() of the assembled source
  int64_t declared_duration_ms = 0;
  std::string mime_type;
};

struct MergeJob {
  std::string group_id;
  std::string owner_id;
  std::vector<MergeSource> sources;  // ordered by statement_index
};

// Stable failure codes reported in MergeOutcome::error_code.
inline constexpr const char* kMergeTimeoutCode = "MERGE_TIMEOUT";
inline constexpr const char* kMergeInternalErrorCode = "MERGE_INTERNAL_ERROR";
inline constexpr const char* kMergeInterruptedCode = "MERGE_INTERRUPTED";
inline constexpr const char* kSourceMissingCode = "SOURCE_MISSING";

struct MergeOutcome {
  enum class Kind { kSucceeded, kFailed, kCancelled };

  Kind kind = Kind::kFailed;
  MergeResult result;          // kSucceeded only
  std::string error_code;      // kFailed only
  std::string error_message;   // kFailed only; client-visible after sanitizing

  static MergeOutcome Succeeded(MergeResult result) {
    MergeOutcome o;
    o.kind = Kind::kSucceeded;
    o.result = std::move(result);
    return o;
  }

  static MergeOutcome Failed(std::string code, std::string message) {
    MergeOutcome o;
    o.kind = Kind::kFailed;
    o.error_code = std::move(code);
    o.error_message = std::move(message);
    return o;
  }

  static MergeOutcome Cancelled() {
    MergeOutcome o;
    o.kind = Kind::kCancelled;
    return o;
  }
};

const char* MergeOutcomeKindName(MergeOutcome::Kind kind);

// Shared between the group (which sets it on cancel) and the worker run
// (which polls it between steps).
class CancellationToken {
 public:
  void Cancel() { cancelled_.store(true, std::memory_order_release); }
  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

// Checks a successful result against its job: one segment per source with
// matching statement indices, positive spans that do not overlap in
// statement order, and a non-empty output locator. Returns an empty string
// when the result is well formed, otherwise what is wrong with it.
std::string CheckMergeResult(const MergeJob& job, const MergeResult& result);

// Keeps the first line only, replaces path-like tokens with "<path>" and
// caps the length. Merge error messages reach clients through group status.
std::string SanitizeMergeMessage(const std::string& message);

// =============================================================================
// Persisted group record (records/groups/<id>)
// =============================================================================

struct GroupSlot {
  std::string session_id;
  bool ready = false;
};

struct MergeGroupRecord {
  std::string group_id;
  std::string owner_id;
  std::array<GroupSlot, upload::kStatementsPerGroup> slots;
  GroupStatus status = GroupStatus::kAwaitingUploads;
  bool merge_triggered = false;  // single-fire latch; never cleared
  int32_t merge_progress_percent = 0;
  bool has_result = false;
  MergeResult result;
  std::string error_code;
  std::string error_message;
  int64_t created_utc_ms = 0;
  int64_t updated_utc_ms = 0;
  int64_t triggered_utc_ms = 0;
  int64_t finished_utc_ms = 0;

  bool AllSlotsReady() const {
    for (const auto& slot : slots) {
      if (!slot.ready) return false;
    }
    return true;
  }

  std::string ToJsonLine() const;
  static bool FromJsonLine(const std::string& line, MergeGroupRecord& out);
};

}  // namespace triptych::merge

#endif  // TRIPTYCH_MERGE_MERGE_TYPES_HPP_
