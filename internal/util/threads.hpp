#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace releaselog::util {

/*
  One-shot completion flag. A worker sets it as its last action; owners
  poll it or wait for it with a deadline. Everything the worker wrote
  before Set() is visible to a caller that observed it set.
*/
class DoneFlag {
 public:
  void Set();

  bool IsSet() const;

  // Returns true iff the flag was set before `deadline`.
  bool WaitUntil(std::chrono::steady_clock::time_point deadline) const;

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            done_ = false;
};

// Waits for `done` until `deadline`, then joins the thread, or detaches it
// when it is still running. A thread asked to join itself is detached.
// Returns false when the thread was left running.
bool JoinUntil(std::thread& thread, const DoneFlag& done, std::chrono::steady_clock::time_point deadline);

} // namespace releaselog::util
