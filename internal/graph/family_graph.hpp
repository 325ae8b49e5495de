#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "internal/graph/person_store.hpp"
#include "internal/graph/relationship_store.hpp"
#include "internal/model/relationship.hpp"

namespace famgraph::graph {

struct TraversalLimits {
  int         max_depth   = 64;
  std::size_t max_visited = 100000;
};

// Graph state copied under the lock together with the mutation counter it
// reflects. Writers use the version to discard snapshots older than one
// already persisted.
struct CommittedSnapshot {
  std::uint64_t        version = 0;
  model::GraphSnapshot graph;
};

struct RestoreStats {
  std::size_t people_loaded         = 0;
  std::size_t people_skipped        = 0;
  std::size_t relationships_loaded  = 0;
  std::size_t relationships_skipped = 0;
};

/*
  FamilyGraph

  Owns both stores and the reader-writer lock guarding them. Every mutation
  validates against a copy first and touches the stores only once nothing can
  fail, so a rejected call leaves the graph unchanged. Queries share the lock
  and return copies.

  Traversals, the consistency checker and the view projector run through
  Read() so that a whole query sees one consistent state.
*/
class FamilyGraph {
 public:
  explicit FamilyGraph(TraversalLimits limits = {});

  FamilyGraph(const FamilyGraph&)            = delete;
  FamilyGraph& operator=(const FamilyGraph&) = delete;

  const TraversalLimits& Limits() const {
    return limits_;
  }

  // --- mutations ---

  model::Person AddPerson(const model::PersonFields& fields);
  model::Person EditPerson(const std::string& id, const model::PersonFields& update);
  // Returns how many relationships the cascade removed.
  std::size_t DeletePerson(const std::string& id);

  model::Relationship AddRelationship(const std::string& person1_id, const std::string& person2_id, std::string_view type,
                                      const model::RelationshipFields& details);
  // person1_id, person2_id and type are required members of fields.
  model::Relationship AddRelationship(const model::RelationshipFields& fields);
  model::Relationship EditRelationship(const std::string& id, const model::RelationshipFields& update);
  void                DeleteRelationship(const std::string& id);

  // --- queries ---

  model::Person                    GetPerson(const std::string& id) const;
  model::Relationship              GetRelationship(const std::string& id) const;
  std::vector<model::Person>       ListPeople() const;
  std::vector<model::Relationship> ListRelationships() const;
  std::vector<model::Relationship> RelationshipsOf(const std::string& person_id) const;
  // Case-insensitive substring match over first name, last name and nickname.
  std::vector<model::Person>       FindPeopleByName(std::string_view query) const;
  // ValidationError for a malformed date or gender filter.
  std::vector<model::Person>       SearchPeople(const model::PersonQuery& query) const;
  std::vector<model::Relationship> FindRelationshipsByType(model::RelationshipType type) const;

  std::size_t PersonCount() const;
  std::size_t RelationshipCount() const;

  // --- persistence ---

  CommittedSnapshot Snapshot() const;
  // Replaces the whole graph. Invalid records are skipped with a warning.
  RestoreStats Restore(const model::GraphSnapshot& snapshot);

  // --- raw access ---

  template <typename Fn>
  decltype(auto) Read(Fn&& fn) const {
    std::shared_lock lock(mutex_);
    return fn(people_, relationships_);
  }

  // Runs fn under the exclusive lock. Counts as one mutation only when fn
  // returns; a throwing fn leaves the version untouched.
  template <typename Fn>
  decltype(auto) Write(Fn&& fn) {
    std::unique_lock lock(mutex_);
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&, PersonStore&, RelationshipStore&>>) {
      fn(people_, relationships_);
      ++version_;
    } else {
      auto result = fn(people_, relationships_);
      ++version_;
      return result;
    }
  }

 private:
  CommittedSnapshot SnapshotLocked() const;

  TraversalLimits limits_;

  mutable std::shared_mutex mutex_;
  PersonStore               people_;
  RelationshipStore         relationships_;
  std::uint64_t             version_ = 0;
};

} // namespace famgraph::graph
