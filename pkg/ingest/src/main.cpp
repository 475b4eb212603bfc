// Repository: Triptych-ingest
// Component: Ingest Daemon
// Purpose: triptych_ingestd entry point. Builds the runtime from flags,
//          serves IngestControl over gRPC until SIGINT/SIGTERM.
// Copyright (c) 2026 Triptych

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "ingest_service.h"
#include "triptych/merge/FFmpegConcatMerger.hpp"
#include "triptych/runtime/IngestRuntime.hpp"
#include "triptych/time/SystemTimeSource.hpp"
#include "triptych/upload/UploadConfig.hpp"
#include "triptych/util/Logger.hpp"

namespace {

using triptych::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  triptych::upload::IngestConfig config;
  bool help = false;
  bool debug = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  const triptych::upload::IngestConfig d;
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Chunked video upload and three-statement merge service.\n"
            << "\n"
            << "SERVER:\n"
            << "  --listen ADDR              gRPC listen address (default: " << d.listen_address << ")\n"
            << "  --storage-root DIR         Chunk/record store root (default: " << d.storage_root << ")\n"
            << "  --output-dir DIR           Merged output directory (default: " << d.output_dir << ")\n"
            << "  --event-journal DIR        Durable event journal directory (default: none)\n"
            << "  --maintenance-interval-ms N  Expiry/retention sweep period (default: "
            << d.maintenance_interval_ms << ")\n"
            << "\n"
            << "UPLOAD LIMITS:\n"
            << "  --chunk-size N             Chunk size in bytes (default: " << d.limits.chunk_size_bytes << ")\n"
            << "  --max-file-size N          Max declared size in bytes (default: "
            << d.limits.max_file_size_bytes << ")\n"
            << "  --min-duration-ms N        (default: " << d.limits.min_duration_ms << ")\n"
            << "  --max-duration-ms N        (default: " << d.limits.max_duration_ms << ")\n"
            << "\n"
            << "SESSIONS:\n"
            << "  --session-timeout-ms N     Idle time before an open session expires (default: "
            << d.sessions.session_timeout_ms << ")\n"
            << "  --retention-ms N           Terminal record retention (default: " << d.sessions.retention_ms << ")\n"
            << "  --max-active-sessions N    Open sessions per owner (default: "
            << d.sessions.max_active_sessions_per_owner << ")\n"
            << "\n"
            << "MERGE:\n"
            << "  --merge-threads N          Merge worker threads (default: " << d.merge.worker_threads << ")\n"
            << "  --merge-timeout-ms N       (default: " << d.merge.merge_timeout_ms << ")\n"
            << "  --quick-merge-grace-ms N   CompleteSession wait for a fired merge (default: "
            << d.merge.quick_merge_grace_ms << ")\n"
            << "\n"
            << "  --debug                    Enable debug log lines\n"
            << "  --help                     Show this help message\n";
}

bool ParseInt64(const std::string& text, int64_t* out) {
  try {
    size_t consumed = 0;
    const long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) return false;
    *out = static_cast<int64_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  auto& cfg = args.config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    }
    if (arg == "--debug") {
      args.debug = true;
      continue;
    }

    if (i + 1 >= argc) {
      args.error = "Unknown argument or missing value: " + arg;
      return args;
    }
    const std::string value = argv[++i];

    if (arg == "--listen") {
      cfg.listen_address = value;
      continue;
    } else if (arg == "--storage-root") {
      cfg.storage_root = value;
      continue;
    } else if (arg == "--output-dir") {
      cfg.output_dir = value;
      continue;
    } else if (arg == "--event-journal") {
      cfg.event_journal_dir = value;
      continue;
    }

    int64_t n = 0;
    if (!ParseInt64(value, &n) || n < 0) {
      args.error = "Invalid value for " + arg + ": " + value;
      return args;
    }

    if (arg == "--chunk-size") {
      cfg.limits.chunk_size_bytes = n;
    } else if (arg == "--max-file-size") {
      cfg.limits.max_file_size_bytes = n;
    } else if (arg == "--min-duration-ms") {
      cfg.limits.min_duration_ms = n;
    } else if (arg == "--max-duration-ms") {
      cfg.limits.max_duration_ms = n;
    } else if (arg == "--session-timeout-ms") {
      cfg.sessions.session_timeout_ms = n;
    } else if (arg == "--retention-ms") {
      cfg.sessions.retention_ms = n;
    } else if (arg == "--max-active-sessions") {
      cfg.sessions.max_active_sessions_per_owner = static_cast<int32_t>(n);
    } else if (arg == "--merge-threads") {
      cfg.merge.worker_threads = static_cast<int32_t>(n);
    } else if (arg == "--merge-timeout-ms") {
      cfg.merge.merge_timeout_ms = n;
    } else if (arg == "--quick-merge-grace-ms") {
      cfg.merge.quick_merge_grace_ms = n;
    } else if (arg == "--maintenance-interval-ms") {
      cfg.maintenance_interval_ms = n;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (cfg.limits.chunk_size_bytes <= 0) {
    args.error = "--chunk-size must be positive";
    return args;
  }
  if (cfg.limits.min_duration_ms > cfg.limits.max_duration_ms) {
    args.error = "--min-duration-ms exceeds --max-duration-ms";
    return args;
  }
  if (cfg.merge.worker_threads <= 0) {
    args.error = "--merge-threads must be positive";
    return args;
  }
  if (cfg.maintenance_interval_ms <= 0) {
    args.error = "--maintenance-interval-ms must be positive";
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  if (args.debug) Logger::SetDebugEnabled(true);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  const triptych::upload::IngestConfig& cfg = args.config;
  std::unique_ptr<triptych::runtime::IngestRuntime> runtime;
  try {
    auto merger = std::make_shared<triptych::merge::FFmpegConcatMerger>(cfg.output_dir);
    runtime = std::make_unique<triptych::runtime::IngestRuntime>(
        cfg, merger, std::make_shared<triptych::time::SystemTimeSource>());
  } catch (const std::exception& e) {
    Logger::Error(std::string("[triptych_ingestd] STARTUP_FAILED error=") + e.what());
    return 1;
  }

  triptych::ingest::IngestControlImpl service(runtime->Interface(), runtime->Broadcaster(),
                                              runtime->Journal());

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(cfg.listen_address, grpc::InsecureServerCredentials(), &bound_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    Logger::Error("[triptych_ingestd] LISTEN_FAILED address=" + cfg.listen_address);
    runtime->Shutdown();
    return 1;
  }

  runtime->Start();
  {
    std::ostringstream oss;
    oss << "[triptych_ingestd] SERVING address=" << cfg.listen_address
        << " storage_root=" << cfg.storage_root << " output_dir=" << cfg.output_dir
        << " merge_threads=" << cfg.merge.worker_threads;
    Logger::Info(oss.str());
  }

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[triptych_ingestd] SHUTDOWN_REQUESTED");
  // Closing subscriptions first lets SubscribeEvents handlers return so the
  // server shutdown does not wait on open streams.
  runtime->Shutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  runtime.reset();
  Logger::Info("[triptych_ingestd] STOPPED");
  return 0;
}
