#include "runbox/coordinator.hpp"

#include <chrono>

#include "runbox/observability.hpp"
#include "runbox/runtime.hpp"

namespace runbox {

namespace {

std::uint64_t ms_since(std::chrono::steady_clock::time_point t0) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count());
}

ExecutionEvent make_event(const ExecutionRequest& request, const ExecutionResult& result, std::uint64_t compile_ms,
                          std::uint64_t run_ms) {
  ExecutionEvent ev;
  ev.attempt_id = result.attempt_id;
  ev.request_id = result.request_id;
  ev.request_digest = result.request_digest;
  ev.language = result.language.empty() ? request.language : result.language;
  ev.status = result.status;
  ev.error_code = result.error_code;
  ev.queue_ms = result.queue_ms;
  ev.compile_ms = compile_ms;
  ev.run_ms = run_ms;
  ev.duration_ms = result.duration_ms;
  ev.bytes_source = request.source.size();
  ev.bytes_stdin = request.stdin_text ? request.stdin_text->size() : 0;
  ev.bytes_stdout = result.stdout_text.size();
  ev.bytes_stderr = result.stderr_text.size();
  ev.truncated = result.stdout_truncated || result.stderr_truncated;
  ev.infra_retries = result.infra_retries;
  return ev;
}

std::unique_ptr<ResourceLimiter> select_limiter(const EngineConfig& config) {
  if (!config.limits_enabled) return std::make_unique<NullLimiter>();
  return make_platform_limiter();
}

}  // namespace

ExecutionCoordinator::ExecutionCoordinator(EngineConfig config, std::shared_ptr<const LanguageRegistry> registry)
    : config_(std::move(config)), registry_(std::move(registry)), limiter_(select_limiter(config_)) {
  workers_.reserve(config_.pool_size);
  for (std::size_t i = 0; i < config_.pool_size; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  emit_log(LogLevel::info, "coordinator", "pool started",
           {{"pool_size", std::to_string(config_.pool_size)},
            {"queue_depth", std::to_string(config_.queue_depth)},
            {"limiter", limiter_->name()}});
}

ExecutionCoordinator::~ExecutionCoordinator() { shutdown(); }

Submission ExecutionCoordinator::reject(const ExecutionRequest& request, const ExecutionResult& result) {
  emit_execution_event(make_event(request, result, 0, 0));
  std::promise<ExecutionResult> p;
  Submission s;
  s.result = p.get_future();
  p.set_value(result);
  return s;
}

Submission ExecutionCoordinator::submit(ExecutionRequest request) {
  // Phase 1: request-time checks. No lock, no slot.
  if (auto rejection = check_request(request, *registry_, config_)) {
    return reject(request, *rejection);
  }

  auto job = std::make_unique<Job>();
  job->toolchain = registry_->lookup(request.language);
  job->request = std::move(request);
  job->cancel = std::make_shared<CancelToken>();
  job->enqueued = std::chrono::steady_clock::now();

  // Phase 2: admission.
  std::unique_lock<std::mutex> lk(mu_);
  if (stopping_) {
    lk.unlock();
    return reject(job->request, make_rejection(job->request, ExecutionStatus::internal_error,
                                               ErrorCode::shutting_down, "engine is shutting down"));
  }
  const std::size_t in_flight = queue_.size() + running_.size();
  if (in_flight >= config_.pool_size + config_.queue_depth) {
    lk.unlock();
    emit_log(LogLevel::warn, "coordinator", "request rejected: overloaded",
             {{"in_flight", std::to_string(in_flight)}, {"language", job->toolchain->id}});
    auto r = make_rejection(job->request, ExecutionStatus::overloaded, ErrorCode::overloaded,
                            "engine at capacity: " + std::to_string(in_flight) + " requests in flight");
    r.language = job->toolchain->id;
    return reject(job->request, r);
  }

  Submission s;
  s.ticket = next_ticket_++;
  job->ticket = s.ticket;
  s.result = job->promise.get_future();
  queue_.push_back(std::move(job));
  global_engine_stats().record_queue_depth(queue_.size());
  lk.unlock();
  cv_.notify_one();
  return s;
}

ExecutionResult ExecutionCoordinator::execute(ExecutionRequest request) {
  return submit(std::move(request)).result.get();
}

void ExecutionCoordinator::resolve_unstarted(Job& job, ErrorCode code, const std::string& message) {
  auto r = make_rejection(job.request, ExecutionStatus::cancelled, code, message);
  r.language = job.toolchain->id;
  r.queue_ms = ms_since(job.enqueued);
  emit_execution_event(make_event(job.request, r, 0, 0));
  job.promise.set_value(std::move(r));
}

bool ExecutionCoordinator::cancel(std::uint64_t ticket) {
  std::unique_ptr<Job> dequeued;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if ((*it)->ticket == ticket) {
        dequeued = std::move(*it);
        queue_.erase(it);
        break;
      }
    }
    if (!dequeued) {
      auto it = running_.find(ticket);
      if (it == running_.end()) return false;
      it->second->cancel();
      emit_log(LogLevel::info, "coordinator", "running attempt cancelled", {{"ticket", std::to_string(ticket)}});
      return true;
    }
  }
  resolve_unstarted(*dequeued, ErrorCode::cancelled, "cancelled while queued");
  return true;
}

PoolHealth ExecutionCoordinator::health() const {
  std::lock_guard<std::mutex> lk(mu_);
  PoolHealth h;
  h.pool_size = config_.pool_size;
  h.queue_capacity = config_.queue_depth;
  h.running = running_.size();
  h.queued = queue_.size();
  h.accepting = !stopping_;
  h.utilization_pct =
      config_.pool_size ? 100.0 * static_cast<double>(h.running) / static_cast<double>(config_.pool_size) : 0.0;
  return h;
}

void ExecutionCoordinator::shutdown() {
  std::deque<std::unique_ptr<Job>> abandoned;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_ && workers_.empty()) return;
    stopping_ = true;
    abandoned.swap(queue_);
  }
  cv_.notify_all();
  for (auto& job : abandoned) {
    resolve_unstarted(*job, ErrorCode::shutting_down, "engine shut down before the request started");
  }
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
}

void ExecutionCoordinator::worker_loop() {
  for (;;) {
    std::unique_ptr<Job> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;
      job = std::move(queue_.front());
      queue_.pop_front();
      running_[job->ticket] = job->cancel;
    }

    ExecutionResult result = run_job(*job);

    {
      std::lock_guard<std::mutex> lk(mu_);
      running_.erase(job->ticket);
    }
    // The slot is free before the caller wakes, so a follow-up submit from
    // the same caller is admitted.
    job->promise.set_value(std::move(result));
  }
}

ExecutionResult ExecutionCoordinator::run_job(Job& job) {
  const std::uint64_t queue_ms = ms_since(job.enqueued);

  const AttemptContext ctx{*registry_, *limiter_, config_};
  std::uint32_t retries = 0;
  AttemptOutcome outcome;
  for (;;) {
    const std::string attempt_id = new_attempt_id();
    outcome = run_attempt(job.request, *job.toolchain, ctx, attempt_id, job.cancel.get());
    if (!outcome.transient || retries >= config_.max_infra_retries || job.cancel->cancelled()) break;
    ++retries;
    global_engine_stats().record_infra_retry();
    emit_log(LogLevel::warn, "coordinator", "transient infrastructure failure, retrying",
             {{"attempt_id", attempt_id},
              {"error_code", outcome.result.error_code},
              {"retry", std::to_string(retries)}});
  }

  outcome.result.queue_ms = queue_ms;
  outcome.result.infra_retries = retries;
  emit_execution_event(make_event(job.request, outcome.result, outcome.compile_ms, outcome.run_ms));
  if (outcome.result.status == ExecutionStatus::internal_error) {
    emit_log(LogLevel::error, "coordinator", "attempt ended in internal error",
             {{"attempt_id", outcome.result.attempt_id},
              {"error_code", outcome.result.error_code},
              {"message", outcome.result.error_message}});
  }
  return std::move(outcome.result);
}

}  // namespace runbox
