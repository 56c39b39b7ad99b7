#pragma once

// runbox/runtime.hpp: One attempt, end to end, plus request/result JSON.
//
// run_attempt() is the whole per-attempt pipeline:
//   workspace create -> source write -> compile (optional) -> run ->
//   classify -> workspace release
// It never throws: guest failures are data, infrastructure failures become
// internal_error, and any unexpected exception is converted the same way.
// The coordinator owns admission, queueing and retries; nothing here is
// shared between attempts.

#include <cstdint>
#include <optional>
#include <string>

#include "runbox/config.hpp"
#include "runbox/language_registry.hpp"
#include "runbox/sandbox.hpp"
#include "runbox/types.hpp"

namespace runbox {

class CancelToken;

// Borrowed engine state for one attempt.
struct AttemptContext {
  const LanguageRegistry& registry;
  const ResourceLimiter& limiter;
  const EngineConfig& config;
};

struct AttemptOutcome {
  ExecutionResult result;
  // Set only for infrastructure failures worth retrying: workspace creation
  // failure and fork/pipe resource exhaustion.
  bool transient{false};
  std::uint64_t compile_ms{0};
  std::uint64_t run_ms{0};
};

// Request-time checks that consume no slot and no workspace: language
// lookup, toolchain availability and input size caps. Returns the rejection
// result, or std::nullopt when the request may be admitted.
std::optional<ExecutionResult> check_request(const ExecutionRequest& request, const LanguageRegistry& registry,
                                             const EngineConfig& config);

AttemptOutcome run_attempt(const ExecutionRequest& request, const ToolchainDescriptor& toolchain,
                           const AttemptContext& ctx, const std::string& attempt_id, CancelToken* cancel);

// Per-request overrides, capped by the engine configuration.
std::uint64_t effective_timeout_ms(const ExecutionRequest& request, const ToolchainDescriptor& toolchain,
                                   const EngineConfig& config);
std::size_t effective_output_bytes(const ExecutionRequest& request, const ToolchainDescriptor& toolchain,
                                   const EngineConfig& config);

// Canonical JSON of language/source/stdin/limits (sorted keys). Input to
// request_digest().
std::string canonicalize_request(const ExecutionRequest& request);

// Random 16-hex-digit id, unique per process with overwhelming probability.
std::string new_attempt_id();

// Result with status, error code and message set, for rejections that never
// reach a worker.
ExecutionResult make_rejection(const ExecutionRequest& request, ExecutionStatus status, ErrorCode code,
                               const std::string& message);

ExecutionRequest parse_request_json(const std::string& json_payload, std::string* error);
std::string request_to_json(const ExecutionRequest& request);
std::string result_to_json(const ExecutionResult& result);
std::string trace_pretty(const ExecutionResult& result);

}  // namespace runbox
