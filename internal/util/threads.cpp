#include "threads.hpp"

namespace releaselog::util {

void DoneFlag::Set() {
  std::lock_guard lock(mutex_);
  done_ = true;
  // notified under the lock: a waiter may destroy the flag once it returns
  cv_.notify_all();
}

bool DoneFlag::IsSet() const {
  std::lock_guard lock(mutex_);
  return done_;
}

bool DoneFlag::WaitUntil(std::chrono::steady_clock::time_point deadline) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_until(lock, deadline, [this] { return done_; });
}

bool JoinUntil(std::thread& thread, const DoneFlag& done, std::chrono::steady_clock::time_point deadline) {
  if (!thread.joinable()) return true;
  if (thread.get_id() == std::this_thread::get_id()) {
    thread.detach();
    return true;
  }

  if (done.WaitUntil(deadline)) {
    thread.join();
    return true;
  }
  thread.detach();
  return false;
}

} // namespace releaselog::util
