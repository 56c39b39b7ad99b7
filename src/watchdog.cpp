#include "runbox/watchdog.hpp"

namespace runbox {

Watchdog::Watchdog(ProcessHandle& handle, std::uint64_t timeout_ms)
    : handle_(handle),
      deadline_(std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms)) {
  thread_ = std::thread([this] { loop(); });
}

Watchdog::~Watchdog() {
  disarm();
  if (thread_.joinable()) thread_.join();
}

void Watchdog::loop() {
  std::unique_lock<std::mutex> lock(mu_);
  if (cv_.wait_until(lock, deadline_, [this] { return disarmed_; })) return;
  if (reason_ == Reason::none) reason_ = Reason::timeout;
  disarmed_ = true;
  lock.unlock();
  handle_.kill_tree();
}

// A trip after disarm() is ignored: the process already finished on its own.
void Watchdog::trip(Reason reason) noexcept {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (disarmed_) return;
    reason_ = reason;
    disarmed_ = true;
  }
  cv_.notify_all();
  handle_.kill_tree();
}

void Watchdog::disarm() noexcept {
  {
    std::lock_guard<std::mutex> lock(mu_);
    disarmed_ = true;
  }
  cv_.notify_all();
}

Watchdog::Reason Watchdog::reason() const noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  return reason_;
}

// The trip happens under mu_: detach() takes the same lock, so the attached
// watchdog cannot be destroyed mid-trip. Watchdog never calls back into the
// token, so there is no lock-order cycle.
void CancelToken::cancel() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  cancelled_ = true;
  if (attached_) attached_->trip(Watchdog::Reason::cancelled);
}

bool CancelToken::cancelled() const noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  return cancelled_;
}

void CancelToken::attach(Watchdog* watchdog) noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  attached_ = watchdog;
  if (cancelled_ && watchdog) watchdog->trip(Watchdog::Reason::cancelled);
}

void CancelToken::detach() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  attached_ = nullptr;
}

}  // namespace runbox
