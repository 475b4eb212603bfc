// Repository: Triptych-ingest
// Component: Ingest configuration
// Purpose: Limits and policies for uploads, sessions and merges. Plain
//          structs with defaults; the daemon overrides them from flags.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UPLOAD_UPLOAD_CONFIG_HPP_
#define TRIPTYCH_UPLOAD_UPLOAD_CONFIG_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace triptych::upload {

// Videos (statements) per merge group.
constexpr int32_t kStatementsPerGroup = 3;

// Per-video declaration limits.
struct UploadLimits {
  int64_t chunk_size_bytes = 1024 * 1024;
  int64_t max_file_size_bytes = 50 * 1024 * 1024;
  int64_t min_duration_ms = 3000;
  int64_t max_duration_ms = 60000;
  std::vector<std::string> allowed_mime_types = {
      "video/mp4", "video/webm", "video/quicktime", "video/mov"};
};

struct SessionPolicy {
  // Sessions with no activity for this long are cancelled (SESSION_EXPIRED).
  int64_t session_timeout_ms = 60LL * 60 * 1000;
  // Terminal sessions and groups are removed after this long.
  int64_t retention_ms = 24LL * 60 * 60 * 1000;
  // Sessions in pending/uploading per owner; 0 disables the quota.
  int32_t max_active_sessions_per_owner = 10;
};

struct MergePolicy {
  int32_t worker_threads = 2;
  int64_t merge_timeout_ms = 300 * 1000;
  // How long CompleteSession waits for a merge it just triggered before
  // answering. 0 disables the wait.
  int64_t quick_merge_grace_ms = 1000;
};

struct IngestConfig {
  std::string listen_address = "0.0.0.0:50071";
  std::string storage_root = "/var/lib/triptych/ingest";
  std::string output_dir = "/var/lib/triptych/merged";
  std::string event_journal_dir;  // empty = no durable journal
  int64_t maintenance_interval_ms = 60 * 1000;

  UploadLimits limits;
  SessionPolicy sessions;
  MergePolicy merge;
};

}  // namespace triptych::upload

#endif  // TRIPTYCH_UPLOAD_UPLOAD_CONFIG_HPP_
