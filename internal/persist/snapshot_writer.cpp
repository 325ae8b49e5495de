#include "snapshot_writer.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace famgraph::persist {

using observability::IntField;
using observability::StringField;

SnapshotWriter::SnapshotWriter(std::shared_ptr<db::Repository> repository, PersistenceMode mode)
    : repository_(std::move(repository)), mode_(mode) {
  if (!repository_) throw std::invalid_argument("SnapshotWriter requires a repository");
}

SnapshotWriter::~SnapshotWriter() {
  Stop();
}

void SnapshotWriter::Start() {
  if (mode_ != PersistenceMode::kAsync || running_) return;
  running_ = true;
  thread_  = std::thread(&SnapshotWriter::Run, this);
}

void SnapshotWriter::Stop() {
  queue_.Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void SnapshotWriter::Run() {
  while (true) {
    auto snapshot = queue_.Dequeue();
    if (!snapshot) break;

    const auto version = snapshot->version;
    auto       error   = Write(*snapshot);
    if (!error.empty()) {
      FAMGRAPH_LOG_ERROR("Snapshot write failed", {IntField("version", static_cast<std::int64_t>(version)), StringField("error", error)});
    }
    queue_.MarkDone(version);
  }
}

std::string SnapshotWriter::Write(const graph::CommittedSnapshot& snapshot) {
  std::lock_guard lock(write_mutex_);
  if (wrote_any_ && snapshot.version <= written_version_) return {};

  std::string error;
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->ReplaceSnapshot(*tx, snapshot.graph);
    if (result) {
      tx->Commit();
    } else {
      tx->Rollback();
      error = std::string(db::ToString(result.code)) + ": " + result.message;
    }
  } catch (const std::runtime_error& ex) {
    error = ex.what();
  }

  std::lock_guard error_lock(error_mutex_);
  if (!error.empty()) {
    last_error_ = error;
    return error;
  }
  written_version_ = snapshot.version;
  wrote_any_       = true;
  last_error_.reset();
  return {};
}

void SnapshotWriter::Persist(graph::CommittedSnapshot snapshot) {
  if (mode_ == PersistenceMode::kAsync && running_) {
    queue_.Enqueue(std::move(snapshot));
    return;
  }

  auto error = Write(snapshot);
  if (!error.empty()) {
    throw util::PersistenceError("graph committed in memory but the durable write failed: " + error);
  }
}

void SnapshotWriter::Flush() {
  if (mode_ != PersistenceMode::kAsync) return;
  queue_.WaitFor(queue_.LastEnqueued());
}

std::optional<std::string> SnapshotWriter::LastError() const {
  std::lock_guard lock(error_mutex_);
  return last_error_;
}

model::GraphSnapshot SnapshotWriter::Load() {
  model::GraphSnapshot snapshot;
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->LoadSnapshot(*tx, snapshot);
    if (!result) {
      throw util::PersistenceError("snapshot load failed: " + std::string(db::ToString(result.code)) + ": " + result.message);
    }
    tx->Commit();
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::runtime_error& ex) {
    throw util::PersistenceError(std::string("snapshot load failed: ") + ex.what());
  }
  return snapshot;
}

} // namespace famgraph::persist
