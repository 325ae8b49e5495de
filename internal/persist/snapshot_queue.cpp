#include "snapshot_queue.hpp"

#include <algorithm>

namespace famgraph::persist {

std::uint64_t SnapshotQueue::Enqueue(graph::CommittedSnapshot snapshot) {
  std::uint64_t version;
  {
    std::lock_guard lock(mutex_);
    version = snapshot.version;
    if (!pending_ || pending_->version < snapshot.version) {
      pending_ = std::move(snapshot);
    }
    enqueued_ = std::max(enqueued_, version);
  }
  cv_.notify_one();
  return version;
}

std::optional<graph::CommittedSnapshot> SnapshotQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || pending_.has_value(); });

  if (!pending_) return std::nullopt;

  auto snapshot = std::move(*pending_);
  pending_.reset();
  return snapshot;
}

void SnapshotQueue::MarkDone(std::uint64_t version) {
  {
    std::lock_guard lock(mutex_);
    done_ = std::max(done_, version);
  }
  done_cv_.notify_all();
}

void SnapshotQueue::WaitFor(std::uint64_t version) {
  std::unique_lock lock(mutex_);
  done_cv_.wait(lock, [&] { return done_ >= version || (shutdown_ && !pending_); });
}

std::uint64_t SnapshotQueue::LastEnqueued() const {
  std::lock_guard lock(mutex_);
  return enqueued_;
}

void SnapshotQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  done_cv_.notify_all();
}

} // namespace famgraph::persist
