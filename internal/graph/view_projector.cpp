#include "internal/graph/view_projector.hpp"

#include <set>
#include <tuple>
#include <unordered_set>
#include <utility>

#include "internal/graph/traversal.hpp"

namespace famgraph::graph {

using model::Person;
using model::Relationship;
using model::RelationshipType;

namespace {

ViewNode ToNode(const Person& person) {
  ViewNode node;
  node.id        = person.id;
  node.full_name = person.FullName();
  node.label     = person.DisplayName();
  if (node.label.empty()) node.label = "Person (" + person.id.substr(0, 8) + ")";
  if (person.gender) node.gender = std::string(model::ToString(*person.gender));
  node.birth_date = person.birth_date;
  node.death_date = person.death_date;
  node.place_of_birth = person.place_of_birth;
  node.place_of_death = person.place_of_death;
  return node;
}

ViewLink Canonical(const Relationship& rel) {
  ViewLink link{rel.id, rel.person1_id, rel.person2_id, std::string(model::ToString(rel.type))};

  switch (rel.type) {
    case RelationshipType::kParent:
      link.type = kParentChildLink;
      break;
    case RelationshipType::kChild:
      link.type = kParentChildLink;
      std::swap(link.source, link.target);
      break;
    default:
      if (model::IsSymmetric(rel.type) && link.target < link.source) std::swap(link.source, link.target);
      break;
  }
  return link;
}

} // namespace

ViewProjector::ViewProjector(const FamilyGraph& graph, int default_depth) : graph_(graph), default_depth_(default_depth) {
}

GraphView ViewProjector::Project(const std::optional<std::string>& start_id, std::optional<int> max_depth) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    std::unordered_set<std::string> included;
    if (start_id) {
      auto ids = GraphTraversal::RelatedIds(people, relationships, *start_id, max_depth.value_or(default_depth_), graph_.Limits());
      included.insert(ids.begin(), ids.end());
      included.insert(*start_id);
    }
    auto in_view = [&](const std::string& id) { return !start_id || included.contains(id); };

    GraphView view;
    people.ForEach([&](const Person& p) {
      if (in_view(p.id)) view.nodes.push_back(ToNode(p));
    });

    std::set<std::tuple<std::string, std::string, std::string>> emitted;
    relationships.ForEach([&](const Relationship& rel) {
      if (!in_view(rel.person1_id) || !in_view(rel.person2_id)) return;
      auto link = Canonical(rel);
      if (!emitted.emplace(link.source, link.target, link.type).second) return;
      view.links.push_back(std::move(link));
    });
    return view;
  });
}

} // namespace famgraph::graph
