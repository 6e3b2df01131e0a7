#include "internal/util/cancellation.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/threads.hpp"

namespace {

using releaselog::util::CancellationScope;

void TestCancelPropagatesDownTheTree() {
  auto root       = CancellationScope::CreateRoot();
  auto child      = root->CreateChild();
  auto grandchild = child->CreateChild();
  auto sibling    = root->CreateChild();

  child->Cancel();
  assert(child->IsCancelled());
  assert(grandchild->IsCancelled());
  assert(!root->IsCancelled());
  assert(!sibling->IsCancelled());

  root->Cancel();
  assert(sibling->IsCancelled());
}

void TestChildOfCancelledScopeIsBornCancelled() {
  auto root = CancellationScope::CreateRoot();
  root->Cancel();
  assert(root->CreateChild()->IsCancelled());
}

void TestDroppedChildrenDoNotKeepScopesAlive() {
  auto                             root = CancellationScope::CreateRoot();
  std::weak_ptr<CancellationScope> weak;
  {
    auto child = root->CreateChild();
    weak       = child;
  }
  assert(weak.expired());
  root->Cancel();
}

void TestWaitForWakesOnCancel() {
  auto root  = CancellationScope::CreateRoot();
  auto child = root->CreateChild();

  assert(!child->WaitFor(std::chrono::milliseconds(10)));

  const auto  start = std::chrono::steady_clock::now();
  std::thread canceller([root] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    root->Cancel();
  });
  assert(child->WaitFor(std::chrono::seconds(10)));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  canceller.join();
}

void TestJoinUntilJoinsFinishedThread() {
  releaselog::util::DoneFlag done;
  std::thread                worker([&done] { done.Set(); });

  assert(releaselog::util::JoinUntil(worker, done, std::chrono::steady_clock::now() + std::chrono::seconds(5)));
  assert(!worker.joinable());
}

void TestJoinUntilWakesWhenWorkerFinishes() {
  releaselog::util::DoneFlag done;
  std::thread                worker([&done] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    done.Set();
  });

  const auto start = std::chrono::steady_clock::now();
  assert(releaselog::util::JoinUntil(worker, done, start + std::chrono::seconds(30)));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  assert(!worker.joinable());
}

void TestJoinUntilDetachesStraggler() {
  auto release = CancellationScope::CreateRoot();
  auto done    = std::make_shared<releaselog::util::DoneFlag>();

  std::thread worker([release, done] {
    release->WaitFor(std::chrono::seconds(30));
    done->Set();
  });

  const auto start = std::chrono::steady_clock::now();
  assert(!releaselog::util::JoinUntil(worker, *done, start + std::chrono::milliseconds(30)));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
  assert(!worker.joinable());
  assert(!done->IsSet());

  release->Cancel();
  assert(done->WaitUntil(std::chrono::steady_clock::now() + std::chrono::seconds(5)));
}

} // namespace

int main() {
  TestCancelPropagatesDownTheTree();
  TestChildOfCancelledScopeIsBornCancelled();
  TestDroppedChildrenDoNotKeepScopesAlive();
  TestWaitForWakesOnCancel();
  TestJoinUntilJoinsFinishedThread();
  TestJoinUntilWakesWhenWorkerFinishes();
  TestJoinUntilDetachesStraggler();

  std::cout << "cancellation_test: pass\n";
  return 0;
}
