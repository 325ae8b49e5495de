#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/graph/traversal.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/graph_fixture.hpp"

namespace {

using famgraph::graph::FamilyGraph;
using famgraph::graph::GraphTraversal;
using famgraph::graph::TraversalLimits;
using famgraph::model::Person;
using famgraph::testing::AddPerson;
using famgraph::testing::Link;
using famgraph::testing::Throws;
namespace util = famgraph::util;

std::vector<std::string> Ids(const std::vector<Person>& people) {
  std::vector<std::string> ids;
  for (const auto& p : people) ids.push_back(p.id);
  return ids;
}

std::set<std::string> IdSet(const std::vector<Person>& people) {
  auto ids = Ids(people);
  return {ids.begin(), ids.end()};
}

/*
  gp1   gp2
    \   /
     p1    p2
      \   / \
       kid   half     (half has p2 only)
        |
      grandkid
*/
struct Family {
  FamilyGraph graph;
  std::string gp1, gp2, p1, p2, kid, half, grandkid;

  Family() {
    gp1      = AddPerson(graph, "Grandpa");
    gp2      = AddPerson(graph, "Grandma");
    p1       = AddPerson(graph, "Parent1");
    p2       = AddPerson(graph, "Parent2");
    kid      = AddPerson(graph, "Kid");
    half     = AddPerson(graph, "Half");
    grandkid = AddPerson(graph, "Grandkid");

    Link(graph, gp1, p1, "parent");
    Link(graph, gp2, p1, "parent");
    Link(graph, p1, kid, "parent");
    Link(graph, p2, kid, "parent");
    Link(graph, p2, half, "parent");
    Link(graph, kid, grandkid, "parent");
    Link(graph, p1, p2, "spouse");
  }
};

void TestAncestorsOneLevelIsExactlyTheParents() {
  Family f;
  GraphTraversal t(f.graph);

  assert(IdSet(t.Ancestors(f.kid, 1)) == (std::set<std::string>{f.p1, f.p2}));
  assert(IdSet(t.Ancestors(f.half, 1)) == (std::set<std::string>{f.p2}));
  assert(t.Ancestors(f.gp1, 1).empty());
}

void TestAncestorsRespectDepth() {
  Family f;
  GraphTraversal t(f.graph);

  assert(IdSet(t.Ancestors(f.grandkid, 2)) == (std::set<std::string>{f.kid, f.p1, f.p2}));
  assert(IdSet(t.Ancestors(f.grandkid, 3)) == (std::set<std::string>{f.kid, f.p1, f.p2, f.gp1, f.gp2}));

  // discovery order: closer generations first
  const auto order = Ids(t.Ancestors(f.grandkid, 3));
  assert(order.front() == f.kid);
  assert(std::find(order.begin(), order.end(), f.gp1) > std::find(order.begin(), order.end(), f.p1));
}

void TestDescendantsMirrorAncestors() {
  Family f;
  GraphTraversal t(f.graph);

  assert(Ids(t.Descendants(f.p1, 1)) == std::vector<std::string>{f.kid});
  assert(IdSet(t.Descendants(f.p2, 1)) == (std::set<std::string>{f.kid, f.half}));
  assert(IdSet(t.Descendants(f.gp1, 3)) == (std::set<std::string>{f.p1, f.kid, f.grandkid}));
}

void TestDepthZeroAndValidation() {
  Family f;
  GraphTraversal t(f.graph);

  assert(t.Ancestors(f.kid, 0).empty());
  assert(t.Descendants(f.kid, 0).empty());
  assert(t.Related(f.kid, 0).empty());
  assert(t.Branch(f.kid, 0).empty());

  // NotFound wins over depth handling
  assert(Throws<util::NotFound>([&] { t.Ancestors("missing", 0); }));
  assert(Throws<util::NotFound>([&] { t.Descendants("missing", -1); }));
  assert(Throws<util::NotFound>([&] { t.Siblings("missing"); }));

  assert(Throws<util::ValidationError>([&] { t.Ancestors(f.kid, -1); }));
  assert(Throws<util::ValidationError>([&] { t.Related(f.kid, 65); }));
}

void TestSiblingsAreTheUnionOverParents() {
  Family f;
  GraphTraversal t(f.graph);

  const auto kid_siblings = IdSet(t.Siblings(f.kid));
  assert(kid_siblings == (std::set<std::string>{f.half}));
  assert(IdSet(t.Siblings(f.half)) == (std::set<std::string>{f.kid}));
  assert(t.Siblings(f.gp1).empty());

  // a full sibling appears once even though reachable through both parents
  const auto full = AddPerson(f.graph, "Full");
  Link(f.graph, f.p1, full, "parent");
  Link(f.graph, f.p2, full, "parent");
  const auto ids = Ids(t.Siblings(f.kid));
  assert(std::count(ids.begin(), ids.end(), full) == 1);
  assert(ids.size() == 2);
}

void TestExtendedFamilyIsAncestorOnly() {
  Family f;
  GraphTraversal t(f.graph);

  assert(Ids(t.ExtendedFamily(f.grandkid, 3)) == Ids(t.Ancestors(f.grandkid, 3)));
  // the half sibling and the spouse link do not widen the result
  assert(IdSet(t.ExtendedFamily(f.kid, 5)) == (std::set<std::string>{f.p1, f.p2, f.gp1, f.gp2}));
}

void TestRelatedFollowsEveryTypeBothWays() {
  Family f;
  GraphTraversal t(f.graph);

  const auto friend_id = AddPerson(f.graph, "Friend");
  Link(f.graph, friend_id, f.gp1, "friend");

  const auto one_hop = IdSet(t.Related(f.p1, 1));
  assert(one_hop == (std::set<std::string>{f.gp1, f.gp2, f.kid, f.p2}));
  assert(!one_hop.contains(f.p1));

  const auto everyone = IdSet(t.Related(f.half, 10));
  assert(everyone.size() == 7);
  assert(everyone.contains(friend_id));
  assert(!everyone.contains(f.half));
}

void TestBranchStartsWithTheStartPerson() {
  Family f;
  GraphTraversal t(f.graph);

  const auto branch = Ids(t.Branch(f.gp1, 3));
  assert((branch == std::vector<std::string>{f.gp1, f.p1, f.kid, f.grandkid}));
  assert((Ids(t.Branch(f.gp1, 1)) == std::vector<std::string>{f.gp1, f.p1}));
}

void TestPartialTree() {
  Family f;
  GraphTraversal t(f.graph);

  auto both = t.BuildPartialTree(f.kid, 2, false, false);
  assert(both.center.id == f.kid);
  assert(IdSet(both.ancestors) == (std::set<std::string>{f.p1, f.p2, f.gp1, f.gp2}));
  assert(Ids(both.descendants) == std::vector<std::string>{f.grandkid});

  auto up = t.BuildPartialTree(f.kid, 2, true, false);
  assert(!up.ancestors.empty() && up.descendants.empty());

  auto down = t.BuildPartialTree(f.kid, 2, false, true);
  assert(down.ancestors.empty() && !down.descendants.empty());

  assert(Throws<util::ValidationError>([&] { t.BuildPartialTree(f.kid, 2, true, true); }));
  // both flags are rejected even for an unknown id
  assert(Throws<util::ValidationError>([&] { t.BuildPartialTree("missing", 2, true, true); }));
  assert(Throws<util::NotFound>([&] { t.BuildPartialTree("missing", 2, false, false); }));
}

void TestParentCyclesTerminate() {
  FamilyGraph graph;
  const auto a = AddPerson(graph, "A");
  const auto b = AddPerson(graph, "B");
  const auto c = AddPerson(graph, "C");
  Link(graph, a, b, "parent");
  Link(graph, b, c, "parent");
  Link(graph, c, a, "parent");

  GraphTraversal t(graph);
  assert(IdSet(t.Ancestors(a, 64)) == (std::set<std::string>{b, c}));
  assert(IdSet(t.Descendants(a, 64)) == (std::set<std::string>{b, c}));
  assert(t.Branch(a, 64).size() == 3);
}

void TestVisitedCeiling() {
  TraversalLimits limits;
  limits.max_visited = 3;
  FamilyGraph graph(limits);

  const auto root = AddPerson(graph, "Root");
  for (int i = 0; i < 5; ++i) {
    Link(graph, root, AddPerson(graph, "Child" + std::to_string(i)), "parent");
  }

  GraphTraversal t(graph);
  assert(Throws<util::ResourceExhausted>([&] { t.Descendants(root, 1); }));
  assert(Throws<util::ResourceExhausted>([&] { t.Related(root, 2); }));
}

void TestEndToEnd() {
  FamilyGraph graph;
  const auto p1 = AddPerson(graph, "P1");
  const auto p2 = AddPerson(graph, "P2");
  Link(graph, p1, p2, "parent");

  GraphTraversal t(graph);
  assert(Ids(t.Descendants(p1, 1)) == std::vector<std::string>{p2});
  assert(Ids(t.Ancestors(p2, 1)) == std::vector<std::string>{p1});
  assert(IdSet(t.Related(p2, 1)).contains(p1));

  graph.DeletePerson(p1);
  assert(t.Ancestors(p2, 1).empty());
  assert(graph.RelationshipCount() == 0);
}

} // namespace

int main() {
  TestAncestorsOneLevelIsExactlyTheParents();
  TestAncestorsRespectDepth();
  TestDescendantsMirrorAncestors();
  TestDepthZeroAndValidation();
  TestSiblingsAreTheUnionOverParents();
  TestExtendedFamilyIsAncestorOnly();
  TestRelatedFollowsEveryTypeBothWays();
  TestBranchStartsWithTheStartPerson();
  TestPartialTree();
  TestParentCyclesTerminate();
  TestVisitedCeiling();
  TestEndToEnd();

  std::cout << "famgraph_unit_traversal: pass\n";
  return 0;
}
