#include "event_multiplexer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace releaselog::stream {

namespace {

// One warn line per this many drops; each drop is logged at debug.
constexpr std::uint64_t kDropWarnEvery = 1000;

} // namespace

const char* EventKindName(const releaselog::v1::StreamEvent& event) {
  switch (event.event_case()) {
    case releaselog::v1::StreamEvent::kPods:
      return "pods";
    case releaselog::v1::StreamEvent::kLog:
      return "log";
    case releaselog::v1::StreamEvent::kPing:
      return "ping";
    default:
      return "unknown";
  }
}

EventMultiplexer::EventMultiplexer(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool EventMultiplexer::TryPush(releaselog::v1::StreamEvent event) {
  bool closed = false;
  {
    std::lock_guard lock(mutex_);
    closed = closed_;
    if (!closed && queue_.size() < capacity_) {
      queue_.push_back(std::move(event));
      pushed_.fetch_add(1, std::memory_order_relaxed);
      cv_.notify_one();
      observability::Metrics::Instance().RecordEventPushed(EventKindName(queue_.back()));
      return true;
    }
  }

  RecordDrop(event, closed);
  return false;
}

void EventMultiplexer::RecordDrop(const releaselog::v1::StreamEvent& event, bool closed) {
  const auto total = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
  observability::Metrics::Instance().RecordEventDropped(EventKindName(event));

  // drops after close are expected while producers wind down
  if (closed) return;

  RELEASELOG_LOG_DEBUG("event dropped", {observability::StringField("kind", EventKindName(event))});
  if (total == 1 || total % kDropWarnEvery == 0) {
    RELEASELOG_LOG_WARN("consumer is not keeping up; dropping events",
                        {observability::IntField("dropped_total", static_cast<int64_t>(total)),
                         observability::IntField("capacity", static_cast<int64_t>(capacity_))});
  }
}

std::optional<releaselog::v1::StreamEvent> EventMultiplexer::Pop() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

PopStatus EventMultiplexer::PopFor(std::chrono::milliseconds timeout, releaselog::v1::StreamEvent* out) {
  std::unique_lock lock(mutex_);

  if (!cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); })) {
    return PopStatus::kTimeout;
  }
  if (queue_.empty()) return PopStatus::kClosed;

  *out = std::move(queue_.front());
  queue_.pop_front();
  return PopStatus::kEvent;
}

bool EventMultiplexer::Close() {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    closed_ = true;
  }
  cv_.notify_all();
  return true;
}

bool EventMultiplexer::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t EventMultiplexer::size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace releaselog::stream
