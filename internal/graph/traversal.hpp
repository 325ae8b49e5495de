#pragma once

#include <string>
#include <vector>

#include "internal/graph/family_graph.hpp"
#include "internal/model/person.hpp"

namespace famgraph::graph {

struct PartialTree {
  model::Person              center;
  std::vector<model::Person> ancestors;
  std::vector<model::Person> descendants;
};

/*
  Breadth-first queries over a FamilyGraph.

  Every query:
    - throws NotFound when the start id is unknown, before looking at depth
    - throws ValidationError for a negative depth or one above max_depth
    - returns an empty result for depth 0
    - keeps a visited set, so parent cycles terminate
    - throws ResourceExhausted once more than max_visited persons are reached

  Results are copies taken under one shared lock, in discovery order.
*/
class GraphTraversal {
 public:
  explicit GraphTraversal(const FamilyGraph& graph);

  // Along parent edges, child to parent.
  std::vector<model::Person> Ancestors(const std::string& id, int depth) const;
  // Along parent edges, parent to child.
  std::vector<model::Person> Descendants(const std::string& id, int depth) const;
  // Children of every parent, full and half siblings alike.
  std::vector<model::Person> Siblings(const std::string& id) const;
  // Ancestor-only, same result as Ancestors.
  std::vector<model::Person> ExtendedFamily(const std::string& id, int depth) const;
  // Any relationship type, both directions. Excludes the start person.
  std::vector<model::Person> Related(const std::string& id, int depth) const;
  // Downward walk listing every visited person, the start person first.
  std::vector<model::Person> Branch(const std::string& id, int depth) const;

  PartialTree BuildPartialTree(const std::string& id, int depth, bool only_ancestors, bool only_descendants) const;

  // Store-level walk for callers already holding the graph lock.
  static std::vector<std::string> RelatedIds(const PersonStore& people, const RelationshipStore& relationships, const std::string& id,
                                             int depth, const TraversalLimits& limits);

 private:
  const FamilyGraph& graph_;
};

} // namespace famgraph::graph
