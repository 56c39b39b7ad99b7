#pragma once

// runbox/worker.hpp: Engine identity and worker-pool health.
//
// DESIGN:
//   Each engine process has one WorkerIdentity, assigned on first use.
//   worker_id: unique within a node (RUNBOX_WORKER_ID or "w-<pid>").
//   node_id:   host the engine runs on (RUNBOX_NODE_ID or hostname).
//   Both appear in `runbox health` so operators can tell engines apart when
//   several share a host.
//
// STATELESS WORKERS:
//   Nothing persists between attempts apart from the global EngineStats.
//   Scaling out means running more engine processes; no coordination is
//   needed between them.

#include <cstdint>
#include <string>

namespace runbox {

struct WorkerIdentity {
  std::string worker_id;
  std::string node_id;
  std::string engine_semver;
};

// Snapshot of one ExecutionCoordinator's pool.
struct PoolHealth {
  std::size_t pool_size{0};
  std::size_t queue_capacity{0};
  std::size_t running{0};
  std::size_t queued{0};
  double utilization_pct{0.0};  // running / pool_size * 100
  bool accepting{true};         // false once shutdown() has begun
};

// Sources, in priority order: explicit arguments, RUNBOX_WORKER_ID /
// RUNBOX_NODE_ID, then defaults.
WorkerIdentity init_worker_identity(const std::string& worker_id = "", const std::string& node_id = "");

const WorkerIdentity& global_worker_identity();

std::string worker_identity_to_json(const WorkerIdentity& w);
std::string pool_health_to_json(const PoolHealth& h);

}  // namespace runbox
