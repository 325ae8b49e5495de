#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/family_graph.hpp"
#include "internal/persist/snapshot_writer.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/graph_fixture.hpp"

namespace {

using famgraph::db::ErrorCode;
using famgraph::db::Result;
using famgraph::db::Transaction;
using famgraph::db::memory::MemoryRepository;
using famgraph::graph::CommittedSnapshot;
using famgraph::graph::FamilyGraph;
using famgraph::model::GraphSnapshot;
using famgraph::persist::PersistenceMode;
using famgraph::persist::SnapshotWriter;
using famgraph::testing::AddPerson;
using famgraph::testing::Throws;
namespace util = famgraph::util;

// Memory repository that can be told to fail writes and counts them.
class FlakyRepository final : public famgraph::db::Repository {
 public:
  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result ReplaceSnapshot(Transaction& tx, const GraphSnapshot& snapshot) override {
    ++writes;
    if (fail) return Result::Err(ErrorCode::IOError, "disk full");
    return inner_.ReplaceSnapshot(tx, snapshot);
  }

  Result LoadSnapshot(Transaction& tx, GraphSnapshot& out) override {
    if (fail) return Result::Err(ErrorCode::Busy, "locked");
    return inner_.LoadSnapshot(tx, out);
  }

  std::atomic<bool> fail{false};
  std::atomic<int>  writes{0};

 private:
  MemoryRepository inner_;
};

void TestSyncWritesInline() {
  auto repo = std::make_shared<FlakyRepository>();
  SnapshotWriter writer(repo, PersistenceMode::kSync);
  writer.Start();

  FamilyGraph graph;
  AddPerson(graph, "Ada");
  writer.Persist(graph.Snapshot());

  assert(repo->writes == 1);
  assert(writer.Load().people.size() == 1);
  assert(!writer.LastError());
}

void TestSyncFailureThrowsAfterCommit() {
  auto repo = std::make_shared<FlakyRepository>();
  SnapshotWriter writer(repo, PersistenceMode::kSync);

  FamilyGraph graph;
  AddPerson(graph, "Ada");
  repo->fail = true;

  assert(Throws<util::PersistenceError>([&] { writer.Persist(graph.Snapshot()); }));
  assert(writer.LastError());
  assert(writer.LastError()->find("disk full") != std::string::npos);
  // the in-memory mutation stays
  assert(graph.PersonCount() == 1);
  assert(Throws<util::PersistenceError>([&] { writer.Load(); }));

  repo->fail = false;
  writer.Persist(graph.Snapshot());
  assert(!writer.LastError());
}

void TestStaleSnapshotsAreDropped() {
  auto repo = std::make_shared<FlakyRepository>();
  SnapshotWriter writer(repo, PersistenceMode::kSync);

  FamilyGraph graph;
  AddPerson(graph, "First");
  const auto older = graph.Snapshot();
  AddPerson(graph, "Second");
  const auto newer = graph.Snapshot();
  assert(newer.version > older.version);

  writer.Persist(newer);
  writer.Persist(older);
  assert(repo->writes == 1);
  assert(writer.Load().people.size() == 2);
}

void TestAsyncWritesInBackground() {
  auto repo = std::make_shared<FlakyRepository>();
  SnapshotWriter writer(repo, PersistenceMode::kAsync);
  writer.Start();
  assert(writer.Mode() == PersistenceMode::kAsync);

  FamilyGraph graph;
  for (int i = 0; i < 20; ++i) {
    AddPerson(graph, "Person" + std::to_string(i));
    writer.Persist(graph.Snapshot());
  }
  writer.Flush();

  // coalescing may skip intermediate snapshots but never the newest
  assert(repo->writes >= 1 && repo->writes <= 20);
  assert(writer.Load().people.size() == 20);
  writer.Stop();
}

void TestAsyncFailureIsRecorded() {
  auto repo = std::make_shared<FlakyRepository>();
  SnapshotWriter writer(repo, PersistenceMode::kAsync);
  writer.Start();
  repo->fail = true;

  FamilyGraph graph;
  AddPerson(graph, "Ada");
  writer.Persist(graph.Snapshot());
  writer.Flush();
  assert(writer.LastError());

  repo->fail = false;
  AddPerson(graph, "Byron");
  writer.Persist(graph.Snapshot());
  writer.Flush();
  assert(!writer.LastError());
  assert(writer.Load().people.size() == 2);
}

void TestConcurrentPersistKeepsNewest() {
  auto repo = std::make_shared<FlakyRepository>();
  SnapshotWriter writer(repo, PersistenceMode::kSync);

  FamilyGraph graph;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10; ++i) {
        AddPerson(graph, "T" + std::to_string(t) + "_" + std::to_string(i));
        writer.Persist(graph.Snapshot());
      }
    });
  }
  for (auto& th : threads) th.join();

  assert(writer.Load().people.size() == 40);
}

void TestRequiresRepository() {
  bool threw = false;
  try {
    SnapshotWriter writer(nullptr, PersistenceMode::kSync);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSyncWritesInline();
  TestSyncFailureThrowsAfterCommit();
  TestStaleSnapshotsAreDropped();
  TestAsyncWritesInBackground();
  TestAsyncFailureIsRecorded();
  TestConcurrentPersistKeepsNewest();
  TestRequiresRepository();

  std::cout << "famgraph_unit_snapshot_writer: pass\n";
  return 0;
}
