#include "cancellation.hpp"

#include <algorithm>

namespace releaselog::util {

std::shared_ptr<CancellationScope> CancellationScope::CreateRoot() {
  return std::shared_ptr<CancellationScope>(new CancellationScope());
}

std::shared_ptr<CancellationScope> CancellationScope::CreateChild() {
  std::shared_ptr<CancellationScope> child(new CancellationScope());

  {
    std::lock_guard lock(mutex_);
    if (!IsCancelled()) {
      children_.erase(std::remove_if(children_.begin(), children_.end(), [](const auto& weak) { return weak.expired(); }),
                      children_.end());
      children_.push_back(child);
      return child;
    }
  }

  child->Cancel();
  return child;
}

void CancellationScope::Cancel() {
  std::vector<std::weak_ptr<CancellationScope>> children;
  {
    std::lock_guard lock(mutex_);
    if (IsCancelled()) return;
    cancelled_.store(true, std::memory_order_release);
    children.swap(children_);
  }
  cv_.notify_all();

  // propagate outside the lock; children take their own
  for (const auto& weak : children) {
    if (auto child = weak.lock()) {
      child->Cancel();
    }
  }
}

} // namespace releaselog::util
