#pragma once

// runbox/coordinator.hpp: Bounded-concurrency admission and dispatch.
//
// DESIGN:
//   A fixed pool of worker threads drains one FIFO queue. Capacity is
//   pool_size running + queue_depth waiting; a submission past that is
//   rejected at once with Overloaded. Request-time rejections (unsupported
//   language, oversized input, missing toolchain) are decided before
//   admission and consume neither a slot nor a workspace.
//
//   All admission state (queue, running set, counters) sits behind one mutex.
//   Attempts themselves share nothing: each owns its workspace, process
//   handle, buffers and CancelToken.
//
// RETRIES:
//   An attempt that failed for a transient infrastructure cause
//   (AttemptOutcome::transient) is rerun with a fresh attempt id and
//   workspace, at most max_infra_retries times. Guest failures, timeouts and
//   missing toolchains are never retried.
//
// CANCELLATION:
//   cancel(ticket) on a queued request removes it and resolves its future
//   with Cancelled. On a running request it trips the attempt's watchdog,
//   which kills the whole process tree exactly as a timeout does.
//
// OWNERSHIP:
//   The coordinator copies its EngineConfig and shares ownership of the
//   registry. The destructor calls shutdown(): queued work resolves as
//   Cancelled and running attempts are waited for.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "runbox/config.hpp"
#include "runbox/language_registry.hpp"
#include "runbox/sandbox.hpp"
#include "runbox/types.hpp"
#include "runbox/watchdog.hpp"
#include "runbox/worker.hpp"

namespace runbox {

struct Submission {
  std::uint64_t ticket{0};  // 0: rejected before admission, nothing to cancel
  std::future<ExecutionResult> result;
};

class ExecutionCoordinator {
 public:
  ExecutionCoordinator(EngineConfig config, std::shared_ptr<const LanguageRegistry> registry);
  ~ExecutionCoordinator();

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  // Never blocks on execution. Rejections come back as an already-ready
  // future.
  Submission submit(ExecutionRequest request);

  // submit() and wait.
  ExecutionResult execute(ExecutionRequest request);

  // False when the ticket is unknown or already finished.
  bool cancel(std::uint64_t ticket);

  PoolHealth health() const;

  // Idempotent.
  void shutdown();

  const EngineConfig& config() const { return config_; }
  const LanguageRegistry& registry() const { return *registry_; }
  const ResourceLimiter& limiter() const { return *limiter_; }

 private:
  struct Job {
    std::uint64_t ticket{0};
    ExecutionRequest request;
    const ToolchainDescriptor* toolchain{nullptr};
    std::promise<ExecutionResult> promise;
    std::shared_ptr<CancelToken> cancel;
    std::chrono::steady_clock::time_point enqueued;
  };

  void worker_loop();
  ExecutionResult run_job(Job& job);
  Submission reject(const ExecutionRequest& request, const ExecutionResult& result);
  void resolve_unstarted(Job& job, ErrorCode code, const std::string& message);

  const EngineConfig config_;
  const std::shared_ptr<const LanguageRegistry> registry_;
  std::unique_ptr<ResourceLimiter> limiter_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::unique_ptr<Job>> queue_;
  std::map<std::uint64_t, std::shared_ptr<CancelToken>> running_;
  std::uint64_t next_ticket_{1};
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

}  // namespace runbox
