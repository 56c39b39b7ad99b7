#include "runbox/observability.hpp"

#include <bit>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#include "runbox/jsonlite.hpp"

namespace runbox {

namespace {

// bit_width gives the bucket index in O(1): floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_ms(uint64_t ms) {
  if (ms == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

size_t status_index(ExecutionStatus s) {
  return static_cast<size_t>(s);
}

std::atomic<ExecutionEventHook> g_event_hook{nullptr};

std::mutex g_log_mu;
std::atomic<int> g_log_level{-1};

LogLevel parse_log_level(const char* s) {
  if (!s) return LogLevel::warn;
  const std::string v(s);
  if (v == "debug") return LogLevel::debug;
  if (v == "info") return LogLevel::info;
  if (v == "error") return LogLevel::error;
  return LogLevel::warn;
}

std::string utc_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ms) {
  buckets_[bucket_for_ms(duration_ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(duration_ms, std::memory_order_relaxed);
}

double LatencyHistogram::mean_ms() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of bucket i: [2^(i-1), 2^i) ms. Bucket 0 covers [0,1)ms.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(128);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count_.load(std::memory_order_relaxed));
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_ms());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_execution(const ExecutionEvent& ev) {
  total_executions.fetch_add(1, std::memory_order_relaxed);
  by_status_[status_index(ev.status)].fetch_add(1, std::memory_order_relaxed);
  if (ev.status == ExecutionStatus::unsupported_language || ev.status == ExecutionStatus::overloaded ||
      (ev.status == ExecutionStatus::resource_exceeded && ev.attempt_id.empty())) {
    rejections.fetch_add(1, std::memory_order_relaxed);
  } else {
    latency_histogram.record(ev.duration_ms);
    queue_histogram.record(ev.queue_ms);
  }
  if (ev.truncated) truncations.fetch_add(1, std::memory_order_relaxed);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

void EngineStats::record_queue_depth(size_t depth) {
  queue_depth_samples.fetch_add(depth, std::memory_order_relaxed);
  queue_depth_count.fetch_add(1, std::memory_order_relaxed);
  uint64_t prev = queue_depth_max.load(std::memory_order_relaxed);
  while (depth > prev && !queue_depth_max.compare_exchange_weak(prev, depth, std::memory_order_relaxed)) {
  }
}

void EngineStats::record_cleanup_failure() {
  cleanup_failures.fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::record_infra_retry() {
  infra_retries.fetch_add(1, std::memory_order_relaxed);
}

uint64_t EngineStats::status_count(ExecutionStatus s) const {
  return by_status_[status_index(s)].load(std::memory_order_relaxed);
}

// Oldest first.
std::vector<ExecutionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  std::vector<ExecutionEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(768);
  char buf[64];

  out += "{\"total_executions\":";
  out += std::to_string(total_executions.load(std::memory_order_relaxed));
  out += ",\"by_status\":{";
  for (size_t i = 0; i < kStatusCount; ++i) {
    if (i) out += ',';
    out += '"';
    out += to_string(static_cast<ExecutionStatus>(i));
    out += "\":";
    out += std::to_string(by_status_[i].load(std::memory_order_relaxed));
  }
  out += "},\"rejections\":";
  out += std::to_string(rejections.load(std::memory_order_relaxed));
  out += ",\"truncations\":";
  out += std::to_string(truncations.load(std::memory_order_relaxed));
  out += ",\"cleanup_failures\":";
  out += std::to_string(cleanup_failures.load(std::memory_order_relaxed));
  out += ",\"infra_retries\":";
  out += std::to_string(infra_retries.load(std::memory_order_relaxed));

  const uint64_t qd_count = queue_depth_count.load(std::memory_order_relaxed);
  const double avg_queue_depth = (qd_count > 0)
      ? (static_cast<double>(queue_depth_samples.load(std::memory_order_relaxed)) /
         static_cast<double>(qd_count))
      : 0.0;
  out += ",\"queue\":{\"avg_depth\":";
  std::snprintf(buf, sizeof(buf), "%.2f", avg_queue_depth);
  out += buf;
  out += ",\"max_depth\":";
  out += std::to_string(queue_depth_max.load(std::memory_order_relaxed));
  out += ",\"wait\":";
  out += queue_histogram.to_json();
  out += "}";

  out += ",\"latency\":";
  out += latency_histogram.to_json();
  out += "}";
  return out;
}

std::string event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["attempt_id"] = ev.attempt_id;
  o["request_id"] = ev.request_id;
  o["request_digest"] = ev.request_digest;
  o["language"] = ev.language;
  o["status"] = to_string(ev.status);
  o["error_code"] = ev.error_code;
  o["queue_ms"] = ev.queue_ms;
  o["compile_ms"] = ev.compile_ms;
  o["run_ms"] = ev.run_ms;
  o["duration_ms"] = ev.duration_ms;
  o["bytes_source"] = static_cast<std::uint64_t>(ev.bytes_source);
  o["bytes_stdin"] = static_cast<std::uint64_t>(ev.bytes_stdin);
  o["bytes_stdout"] = static_cast<std::uint64_t>(ev.bytes_stdout);
  o["bytes_stderr"] = static_cast<std::uint64_t>(ev.bytes_stderr);
  o["truncated"] = ev.truncated;
  o["infra_retries"] = static_cast<std::uint64_t>(ev.infra_retries);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

void set_execution_event_hook(ExecutionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_execution_event(const ExecutionEvent& ev) {
  global_engine_stats().record_execution(ev);

  ExecutionEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("RUNBOX_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND is atomic for writes < PIPE_BUF on POSIX; the mutex covers the rest.
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "warn";
}

LogLevel current_log_level() {
  int v = g_log_level.load(std::memory_order_relaxed);
  if (v < 0) {
    v = static_cast<int>(parse_log_level(std::getenv("RUNBOX_LOG_LEVEL")));
    g_log_level.store(v, std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(v);
}

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

void emit_log(LogLevel level, const std::string& component, const std::string& message,
              const std::map<std::string, std::string>& fields) {
  if (static_cast<int>(level) < static_cast<int>(current_log_level())) return;

  jsonlite::Object o;
  o["ts"] = utc_timestamp();
  o["level"] = to_string(level);
  o["component"] = component;
  o["msg"] = message;
  for (const auto& [k, v] : fields) {
    if (!o.contains(k)) o[k] = v;
  }
  std::string line = jsonlite::to_json(jsonlite::Value{std::move(o)});
  line += '\n';

  std::lock_guard<std::mutex> lk(g_log_mu);
  const char* path = std::getenv("RUNBOX_LOG");
  if (path && path[0]) {
    if (FILE* f = std::fopen(path, "a")) {
      std::fwrite(line.data(), 1, line.size(), f);
      std::fclose(f);
      return;
    }
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace runbox
