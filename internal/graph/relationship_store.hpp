#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/relationship.hpp"

namespace famgraph::graph {

/*
  Arena of Relationship records plus two indexes maintained on every
  mutation:

    adjacency   person id -> slots of every edge touching the person
    edge keys   (person1, person2, type) -> relationship id

  The edge-key index is what enforces the no-duplicate-triple invariant.
  Not thread-safe: FamilyGraph guards every access.
*/
class RelationshipStore {
 public:
  const model::Relationship* Find(const std::string& id) const;

  bool Contains(const std::string& id) const {
    return index_.contains(id);
  }

  // Id of the relationship carrying exactly this triple, if any.
  std::optional<std::string> FindEdge(const std::string& person1_id, const std::string& person2_id, model::RelationshipType type) const;

  // Caller guarantees a fresh id and an unused triple.
  const model::Relationship& Insert(model::Relationship relationship);

  // Swaps in a new version of an existing record and re-indexes it.
  const model::Relationship& Replace(model::Relationship relationship);

  bool Erase(const std::string& id);

  void Clear();

  std::size_t Size() const {
    return index_.size();
  }

  // Ids of the edges touching person_id, in adjacency order.
  std::vector<std::string> EdgeIdsOf(const std::string& person_id) const;

  // Visits every edge touching person_id.
  template <typename Fn>
  void ForEachEdgeOf(const std::string& person_id, Fn&& fn) const {
    auto it = adjacency_.find(person_id);
    if (it == adjacency_.end()) return;
    for (auto slot : it->second) {
      fn(*arena_[slot]);
    }
  }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& slot : arena_) {
      if (slot) fn(*slot);
    }
  }

 private:
  static std::string EdgeKey(const std::string& person1_id, const std::string& person2_id, model::RelationshipType type);

  void Link(std::size_t slot);
  void Unlink(std::size_t slot);

  std::vector<std::optional<model::Relationship>> arena_;
  std::vector<std::size_t>                        free_slots_;
  std::unordered_map<std::string, std::size_t>    index_;

  std::unordered_map<std::string, std::vector<std::size_t>> adjacency_;
  std::unordered_map<std::string, std::string>              edge_keys_;
};

} // namespace famgraph::graph
