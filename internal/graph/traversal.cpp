#include "internal/graph/traversal.hpp"

#include <queue>
#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"

namespace famgraph::graph {

using model::Person;
using model::Relationship;
using model::RelationshipType;

namespace {

enum class Direction {
  kUp,   // child -> parent
  kDown, // parent -> child
  kAny,  // every edge, both ways
};

void CheckStart(const PersonStore& people, const std::string& id) {
  if (!people.Contains(id)) throw util::NotFound("person not found: " + id);
}

void CheckDepth(int depth, const TraversalLimits& limits) {
  if (depth < 0) throw util::ValidationError("depth must not be negative");
  if (depth > limits.max_depth) {
    throw util::ValidationError("depth " + std::to_string(depth) + " exceeds the maximum of " + std::to_string(limits.max_depth));
  }
}

/*
  Level-bounded BFS from `start`. Returns newly discovered ids in discovery
  order; the start id itself is never part of the result.
*/
std::vector<std::string> Walk(const RelationshipStore& relationships, const std::string& start, int depth, Direction direction,
                              const TraversalLimits& limits) {
  std::vector<std::string>                 found;
  std::queue<std::pair<std::string, int>> q;
  std::unordered_set<std::string>          visited;

  if (depth == 0) return found;

  q.emplace(start, 0);
  visited.insert(start);

  while (!q.empty()) {
    const std::string node  = q.front().first;
    const int         level = q.front().second;
    q.pop();

    relationships.ForEachEdgeOf(node, [&](const Relationship& rel) {
      const std::string* next = nullptr;
      switch (direction) {
        case Direction::kUp:
          if (rel.type == RelationshipType::kParent && rel.person2_id == node) next = &rel.person1_id;
          break;
        case Direction::kDown:
          if (rel.type == RelationshipType::kParent && rel.person1_id == node) next = &rel.person2_id;
          break;
        case Direction::kAny:
          next = &rel.Other(node);
          break;
      }
      if (!next || !visited.insert(*next).second) return;

      if (visited.size() > limits.max_visited) {
        throw util::ResourceExhausted("traversal visited more than " + std::to_string(limits.max_visited) + " persons");
      }
      found.push_back(*next);
      if (level + 1 < depth) q.emplace(*next, level + 1);
    });
  }

  return found;
}

std::vector<Person> Materialize(const PersonStore& people, const std::vector<std::string>& ids) {
  std::vector<Person> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    if (const auto* person = people.Find(id)) out.push_back(*person);
  }
  return out;
}

} // namespace

GraphTraversal::GraphTraversal(const FamilyGraph& graph) : graph_(graph) {
}

std::vector<Person> GraphTraversal::Ancestors(const std::string& id, int depth) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    CheckStart(people, id);
    CheckDepth(depth, graph_.Limits());
    return Materialize(people, Walk(relationships, id, depth, Direction::kUp, graph_.Limits()));
  });
}

std::vector<Person> GraphTraversal::Descendants(const std::string& id, int depth) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    CheckStart(people, id);
    CheckDepth(depth, graph_.Limits());
    return Materialize(people, Walk(relationships, id, depth, Direction::kDown, graph_.Limits()));
  });
}

std::vector<Person> GraphTraversal::Siblings(const std::string& id) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    CheckStart(people, id);

    std::vector<std::string>        ids;
    std::unordered_set<std::string> seen{id};
    for (const auto& parent : Walk(relationships, id, 1, Direction::kUp, graph_.Limits())) {
      for (auto& child : Walk(relationships, parent, 1, Direction::kDown, graph_.Limits())) {
        if (seen.insert(child).second) ids.push_back(std::move(child));
      }
    }
    return Materialize(people, ids);
  });
}

std::vector<Person> GraphTraversal::ExtendedFamily(const std::string& id, int depth) const {
  return Ancestors(id, depth);
}

std::vector<std::string> GraphTraversal::RelatedIds(const PersonStore& people, const RelationshipStore& relationships, const std::string& id,
                                                    int depth, const TraversalLimits& limits) {
  CheckStart(people, id);
  CheckDepth(depth, limits);
  return Walk(relationships, id, depth, Direction::kAny, limits);
}

std::vector<Person> GraphTraversal::Related(const std::string& id, int depth) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    return Materialize(people, RelatedIds(people, relationships, id, depth, graph_.Limits()));
  });
}

std::vector<Person> GraphTraversal::Branch(const std::string& id, int depth) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    CheckStart(people, id);
    CheckDepth(depth, graph_.Limits());

    std::vector<std::string> ids;
    if (depth == 0) return Materialize(people, ids);

    ids.push_back(id);
    for (auto& child : Walk(relationships, id, depth, Direction::kDown, graph_.Limits())) {
      ids.push_back(std::move(child));
    }
    return Materialize(people, ids);
  });
}

PartialTree GraphTraversal::BuildPartialTree(const std::string& id, int depth, bool only_ancestors, bool only_descendants) const {
  if (only_ancestors && only_descendants) {
    throw util::ValidationError("only_ancestors and only_descendants are mutually exclusive");
  }

  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    CheckStart(people, id);
    CheckDepth(depth, graph_.Limits());

    PartialTree tree;
    tree.center = *people.Find(id);
    if (!only_descendants) {
      tree.ancestors = Materialize(people, Walk(relationships, id, depth, Direction::kUp, graph_.Limits()));
    }
    if (!only_ancestors) {
      tree.descendants = Materialize(people, Walk(relationships, id, depth, Direction::kDown, graph_.Limits()));
    }
    return tree;
  });
}

} // namespace famgraph::graph
