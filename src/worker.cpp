#include "runbox/worker.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>

#ifdef _WIN32
#include <process.h>
#include <winsock2.h>
#else
#include <unistd.h>  // getpid, gethostname
#endif

#include "runbox/jsonlite.hpp"
#include "runbox/version.hpp"

namespace runbox {

namespace {

WorkerIdentity g_worker_identity;
std::mutex g_init_mu;
bool g_initialized{false};

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
  return "unknown-host";
}

std::string make_default_worker_id() {
#ifdef _WIN32
  return "w-" + std::to_string(static_cast<long>(::_getpid()));
#else
  return "w-" + std::to_string(static_cast<long>(::getpid()));
#endif
}

std::string env_or(const char* name, std::string def) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : def;
}

}  // namespace

WorkerIdentity init_worker_identity(const std::string& worker_id, const std::string& node_id) {
  std::lock_guard<std::mutex> lk(g_init_mu);
  g_worker_identity.worker_id = worker_id.empty() ? env_or("RUNBOX_WORKER_ID", make_default_worker_id()) : worker_id;
  g_worker_identity.node_id = node_id.empty() ? env_or("RUNBOX_NODE_ID", get_hostname()) : node_id;
  g_worker_identity.engine_semver = version::ENGINE_SEMVER;
  g_initialized = true;
  return g_worker_identity;
}

const WorkerIdentity& global_worker_identity() {
  {
    std::lock_guard<std::mutex> lk(g_init_mu);
    if (g_initialized) return g_worker_identity;
  }
  init_worker_identity();
  return g_worker_identity;
}

std::string worker_identity_to_json(const WorkerIdentity& w) {
  std::ostringstream o;
  o << "{"
    << "\"worker_id\":\"" << jsonlite::escape(w.worker_id) << "\""
    << ",\"node_id\":\"" << jsonlite::escape(w.node_id) << "\""
    << ",\"engine_semver\":\"" << w.engine_semver << "\""
    << "}";
  return o.str();
}

std::string pool_health_to_json(const PoolHealth& h) {
  std::ostringstream o;
  char buf[32];
  o << "{"
    << "\"pool_size\":" << h.pool_size
    << ",\"queue_capacity\":" << h.queue_capacity
    << ",\"running\":" << h.running
    << ",\"queued\":" << h.queued
    << ",\"accepting\":" << (h.accepting ? "true" : "false")
    << ",\"utilization_pct\":";
  std::snprintf(buf, sizeof(buf), "%.2f", h.utilization_pct);
  o << buf << "}";
  return o.str();
}

}  // namespace runbox
