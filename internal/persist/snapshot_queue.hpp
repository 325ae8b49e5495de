#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

#include "internal/graph/family_graph.hpp"

namespace famgraph::persist {

/*
  Single-slot blocking queue for the snapshot worker.

  Only the newest pending snapshot matters, so Enqueue replaces whatever is
  still waiting. Versions let Flush() wait until everything enqueued so far
  has been handled.
*/
class SnapshotQueue {
 public:
  // Returns the version callers can wait on.
  std::uint64_t Enqueue(graph::CommittedSnapshot snapshot);

  // blocking wait; nullopt once shut down and drained
  std::optional<graph::CommittedSnapshot> Dequeue();

  // Called by the worker after a write attempt, successful or not.
  void MarkDone(std::uint64_t version);

  // Blocks until every snapshot up to `version` was handled or the queue shut down.
  void WaitFor(std::uint64_t version);

  std::uint64_t LastEnqueued() const;

  void Shutdown();

 private:
  mutable std::mutex                      mutex_;
  std::condition_variable                 cv_;
  std::condition_variable                 done_cv_;
  std::optional<graph::CommittedSnapshot> pending_;
  std::uint64_t                           enqueued_ = 0;
  std::uint64_t                           done_     = 0;
  bool                                    shutdown_ = false;
};

} // namespace famgraph::persist
