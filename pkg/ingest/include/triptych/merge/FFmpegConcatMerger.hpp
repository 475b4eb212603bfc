// Repository: Triptych-ingest
// Component: FFmpeg Concat Merger
// Purpose: Production IVideoMerger. Stream-copies the group's sources, in
//          statement order, into one MP4 and reports per-statement timing.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_MERGE_FFMPEG_CONCAT_MERGER_HPP_
#define TRIPTYCH_MERGE_FFMPEG_CONCAT_MERGER_HPP_

#include <string>

#include "triptych/merge/IVideoMerger.hpp"

namespace triptych::merge {

// Failure codes reported by this merger.
inline constexpr const char* kSourceOpenFailedCode = "SOURCE_OPEN_FAILED";
inline constexpr const char* kSourceProbeFailedCode = "SOURCE_PROBE_FAILED";
inline constexpr const char* kIncompatibleSourcesCode = "INCOMPATIBLE_SOURCES";
inline constexpr const char* kOutputOpenFailedCode = "OUTPUT_OPEN_FAILED";
inline constexpr const char* kMuxFailedCode = "MUX_FAILED";

// No re-encode: every source must carry the same video codec and frame size
// (and the same audio codec, if any has audio). Sources are opened by their
// locator, so the store must hand out filesystem paths.
class FFmpegConcatMerger : public IVideoMerger {
 public:
  // Creates output_dir if missing; throws std::runtime_error if it cannot.
  explicit FFmpegConcatMerger(std::string output_dir);

  // Output: <output_dir>/<group_id>.mp4, written under a temporary name and
  // renamed on success.
  MergeOutcome Run(const MergeJob& job, MergeContext& context) override;

  std::string OutputPathFor(const std::string& group_id) const;

 private:
  std::string output_dir_;
};

}  // namespace triptych::merge

#endif  // TRIPTYCH_MERGE_FFMPEG_CONCAT_MERGER_HPP_
