#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace releaselog::util {

/*
  Node of a cancellation tree.

  Cancelling a scope cancels every scope created from it through
  CreateChild(). Children are tracked weakly: a scope lives as long as its
  owner holds it, and a child created from an already cancelled parent is
  born cancelled.

  Thread-affinity: any.
*/
class CancellationScope : public std::enable_shared_from_this<CancellationScope> {
 public:
  static std::shared_ptr<CancellationScope> CreateRoot();

  std::shared_ptr<CancellationScope> CreateChild();

  void Cancel();

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Sleeps for up to `timeout`. Returns true iff the scope is cancelled.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return IsCancelled(); });
  }

  CancellationScope(const CancellationScope&)            = delete;
  CancellationScope& operator=(const CancellationScope&) = delete;

 private:
  CancellationScope() = default;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool>               cancelled_{false};

  std::vector<std::weak_ptr<CancellationScope>> children_;
};

using CancellationScopePtr = std::shared_ptr<CancellationScope>;

} // namespace releaselog::util
