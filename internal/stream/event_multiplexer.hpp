#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "releaselog/v1/types.pb.h"

namespace releaselog::stream {

enum class PopStatus {
  kEvent,
  kTimeout,
  kClosed, // closed and fully drained
};

/*
  Bounded fan-in queue between every producer of one subscription and its
  single consumer.

  Producers never block: TryPush drops the event when the queue is full or
  closed. After Close() the consumer still drains what was queued and then
  observes kClosed.
*/
class EventMultiplexer {
 public:
  explicit EventMultiplexer(std::size_t capacity);

  bool TryPush(releaselog::v1::StreamEvent event);

  // blocking wait; nullopt once closed and drained
  std::optional<releaselog::v1::StreamEvent> Pop();

  PopStatus PopFor(std::chrono::milliseconds timeout, releaselog::v1::StreamEvent* out);

  // Returns true for the call that actually closed the queue.
  bool Close();

  bool IsClosed() const;

  std::size_t size() const;

  std::size_t capacity() const {
    return capacity_;
  }

  std::uint64_t pushed() const {
    return pushed_.load(std::memory_order_relaxed);
  }

  std::uint64_t dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

 private:
  void RecordDrop(const releaselog::v1::StreamEvent& event, bool closed);

  const std::size_t capacity_;

  mutable std::mutex                      mutex_;
  std::condition_variable                 cv_;
  std::deque<releaselog::v1::StreamEvent> queue_;
  bool                                    closed_ = false;

  std::atomic<std::uint64_t> pushed_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

// "pods" / "log" / "ping"
const char* EventKindName(const releaselog::v1::StreamEvent& event);

} // namespace releaselog::stream
