#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "internal/graph/family_graph.hpp"
#include "snapshot_queue.hpp"

namespace famgraph::persist {

enum class PersistenceMode {
  kSync,
  kAsync,
};

/*
  Hands committed graph snapshots to the repository.

  kSync   writes inline; a failed write throws util::PersistenceError after
          the in-memory mutation already committed.
  kAsync  a single background thread writes the newest pending snapshot;
          failures are logged and kept in LastError().

  Snapshots older than the last one written are dropped in both modes.
*/
class SnapshotWriter {
 public:
  SnapshotWriter(std::shared_ptr<db::Repository> repository, PersistenceMode mode);
  ~SnapshotWriter();

  SnapshotWriter(const SnapshotWriter&)            = delete;
  SnapshotWriter& operator=(const SnapshotWriter&) = delete;

  void Start();
  void Stop();

  void Persist(graph::CommittedSnapshot snapshot);

  // Blocks until everything handed to Persist so far was written or failed.
  void Flush();

  std::optional<std::string> LastError() const;

  PersistenceMode Mode() const {
    return mode_;
  }

  // Loads the stored snapshot; throws util::PersistenceError on failure.
  model::GraphSnapshot Load();

 private:
  void Run();

  // Returns an error message, empty on success.
  std::string Write(const graph::CommittedSnapshot& snapshot);

  std::shared_ptr<db::Repository> repository_;
  PersistenceMode                 mode_;

  SnapshotQueue     queue_;
  std::thread       thread_;
  std::atomic<bool> running_{false};

  std::mutex    write_mutex_;
  std::uint64_t written_version_ = 0;
  bool          wrote_any_       = false;

  mutable std::mutex         error_mutex_;
  std::optional<std::string> last_error_;
};

} // namespace famgraph::persist
