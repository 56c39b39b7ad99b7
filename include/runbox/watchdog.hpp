#pragma once

// runbox/watchdog.hpp: Wall-clock enforcement for one process tree.
//
// A Watchdog is armed on construction and owns one thread that sleeps on a
// condition variable until either the deadline passes or it is disarmed.
// On expiry it records Reason::timeout and calls ProcessHandle::kill_tree().
// trip() takes the same path immediately and is how cancellation kills a
// running attempt. The destructor disarms and joins, so a Watchdog can never
// outlive the handle it guards.
//
// CancelToken is the only object shared between the coordinator and a
// running attempt. run_process() attaches its watchdog for the lifetime of
// each process; cancel() trips whatever is attached at that moment and makes
// any later attach() trip immediately.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "runbox/sandbox.hpp"

namespace runbox {

class Watchdog {
 public:
  enum class Reason { none, timeout, cancelled };

  Watchdog(ProcessHandle& handle, std::uint64_t timeout_ms);
  ~Watchdog();

  Watchdog(const Watchdog&) = delete;
  Watchdog& operator=(const Watchdog&) = delete;

  // Kill the tree now. The first reason recorded wins.
  void trip(Reason reason) noexcept;
  void disarm() noexcept;

  Reason reason() const noexcept;
  bool fired() const noexcept { return reason() != Reason::none; }

 private:
  void loop();

  ProcessHandle& handle_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool disarmed_{false};
  Reason reason_{Reason::none};
  std::chrono::steady_clock::time_point deadline_;
  std::thread thread_;
};

class CancelToken {
 public:
  void cancel() noexcept;
  bool cancelled() const noexcept;

  void attach(Watchdog* watchdog) noexcept;
  void detach() noexcept;

 private:
  mutable std::mutex mu_;
  bool cancelled_{false};
  Watchdog* attached_{nullptr};
};

}  // namespace runbox
