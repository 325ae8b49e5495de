#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/graph/family_graph.hpp"
#include "internal/model/person.hpp"

namespace famgraph::graph {

enum class IssueKind {
  kSelfRelationship,
  kRedundantReciprocal,
  kContradictoryEdges,
  kAncestorCycle,
};

std::string_view ToString(IssueKind kind);

struct Issue {
  IssueKind                kind;
  std::string              person_id;
  std::vector<std::string> relationship_ids;
  std::string              message;
};

struct DuplicatePolicy {
  // When set, two same-name persons only match if their birth dates are equal
  // or at least one of them is unknown.
  bool compare_birth_date = true;
};

struct DuplicateCandidate {
  std::string first_id;
  std::string second_id;
  bool        birth_date_compared = false;
};

struct MergeResult {
  model::Person person;
  std::size_t   relationships_rewritten = 0;
  std::size_t   relationships_dropped   = 0;
};

/*
  ConsistencyChecker

  Reports problems around a person and finds likely duplicate records.
  Check and FindDuplicates never modify the graph; Merge is the only
  mutation and runs as a single exclusive-lock operation.
*/
class ConsistencyChecker {
 public:
  explicit ConsistencyChecker(FamilyGraph& graph);

  std::vector<Issue> Check(const std::string& person_id) const;

  std::vector<DuplicateCandidate> FindDuplicates(const DuplicatePolicy& policy) const;

  // Folds remove_id into keep_id and deletes remove_id.
  MergeResult Merge(const std::string& keep_id, const std::string& remove_id);

 private:
  FamilyGraph& graph_;
};

} // namespace famgraph::graph
