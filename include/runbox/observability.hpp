#pragma once

// runbox/observability.hpp: Structured execution events, engine statistics
// and JSONL logging.
//
// DESIGN:
//   ExecutionEvent is the observable unit. Every attempt that reaches a
//   worker, and every request rejected at admission, emits exactly one event:
//     - recorded in the global EngineStats (always),
//     - passed to the registered hook, if any,
//     - otherwise appended as one JSON line to RUNBOX_EVENT_LOG when set.
//   Events carry digests and sizes, never guest stdout/stderr content.
//
// LOGGING:
//   emit_log() writes one JSON object per line to RUNBOX_LOG (a file path)
//   or stderr. RUNBOX_LOG_LEVEL selects the minimum level (debug, info, warn,
//   error); the default is warn so CLI output stays clean.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Register an ExecutionEventHook that converts events to spans.
//   Invariant: the hook must not block; it runs on the worker thread.

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "runbox/types.hpp"

namespace runbox {

// ---------------------------------------------------------------------------
// ExecutionEvent: per-attempt observable unit
// ---------------------------------------------------------------------------
struct ExecutionEvent {
  std::string attempt_id;
  std::string request_id;
  std::string request_digest;
  std::string language;
  ExecutionStatus status{ExecutionStatus::internal_error};
  std::string error_code;

  uint64_t queue_ms{0};
  uint64_t compile_ms{0};
  uint64_t run_ms{0};
  uint64_t duration_ms{0};  // compile + run

  size_t bytes_source{0};
  size_t bytes_stdin{0};
  size_t bytes_stdout{0};
  size_t bytes_stderr{0};
  bool truncated{false};
  uint32_t infra_retries{0};
};

std::string event_to_json(const ExecutionEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) ms, 2^i ms); bucket 0 is [0, 1ms).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 24;  // up to ~2.3 hours

  void record(uint64_t duration_ms);

  // Approximate percentile in ms, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_ms() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_ms_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the ring buffer uses a mutex. Nothing in
// the attempt pipeline reads these, so they never couple two attempts.
class EngineStats {
 public:
  static constexpr size_t kStatusCount = 9;

  void record_execution(const ExecutionEvent& ev);
  void record_queue_depth(size_t depth);
  void record_cleanup_failure();
  void record_infra_retry();

  uint64_t status_count(ExecutionStatus s) const;
  uint64_t total() const { return total_executions.load(std::memory_order_relaxed); }

  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_executions{0};
  alignas(64) std::atomic<uint64_t> rejections{0};  // unsupported/overloaded/oversized
  alignas(64) std::atomic<uint64_t> cleanup_failures{0};
  alignas(64) std::atomic<uint64_t> infra_retries{0};
  alignas(64) std::atomic<uint64_t> truncations{0};
  alignas(64) std::atomic<uint64_t> queue_depth_samples{0};  // sum of snapshots
  alignas(64) std::atomic<uint64_t> queue_depth_count{0};
  alignas(64) std::atomic<uint64_t> queue_depth_max{0};

  LatencyHistogram latency_histogram;
  LatencyHistogram queue_histogram;

  // ring_head_ is the next slot to overwrite (oldest entry when full).
  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<ExecutionEvent> recent_events_snapshot() const;

 private:
  std::array<std::atomic<uint64_t>, kStatusCount> by_status_{};
  mutable std::mutex ring_mu_;
  std::vector<ExecutionEvent> ring_buffer_;
  size_t ring_head_{0};
};

EngineStats& global_engine_stats();

// Non-blocking, fire-and-forget.
void emit_execution_event(const ExecutionEvent& ev);

using ExecutionEventHook = void (*)(const ExecutionEvent&);
void set_execution_event_hook(ExecutionEventHook hook);

// ---------------------------------------------------------------------------
// Structured logging
// ---------------------------------------------------------------------------
enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);

// Reads RUNBOX_LOG_LEVEL once.
LogLevel current_log_level();
void set_log_level(LogLevel level);

void emit_log(LogLevel level, const std::string& component, const std::string& message,
              const std::map<std::string, std::string>& fields = {});

}  // namespace runbox
