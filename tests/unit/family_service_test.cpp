#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include "internal/audit/audit_log.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/family_graph.hpp"
#include "internal/persist/snapshot_writer.hpp"
#include "internal/service/family_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/graph_fixture.hpp"

namespace {

using famgraph::testing::Throws;
namespace v1   = famgraph::v1;
namespace util = famgraph::util;

struct Harness {
  std::ostringstream                           audit_out;
  std::shared_ptr<famgraph::graph::FamilyGraph> graph = std::make_shared<famgraph::graph::FamilyGraph>();
  std::shared_ptr<famgraph::db::memory::MemoryRepository> repo = std::make_shared<famgraph::db::memory::MemoryRepository>();
  std::shared_ptr<famgraph::persist::SnapshotWriter> writer =
      std::make_shared<famgraph::persist::SnapshotWriter>(repo, famgraph::persist::PersistenceMode::kSync);
  std::unique_ptr<famgraph::service::FamilyService> service;

  Harness() {
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(audit_out);
    auto logger = std::make_shared<spdlog::logger>("audit_test", sink);
    logger->set_pattern("%v");

    famgraph::service::ServiceContext ctx;
    ctx.graph  = graph;
    ctx.writer = writer;
    ctx.audit  = std::make_shared<famgraph::audit::AuditLog>(logger);
    service    = std::make_unique<famgraph::service::FamilyService>(ctx);
  }

  std::string AddPerson(const std::string& first, const std::string& actor = "tester") {
    v1::AddPersonRequest req;
    req.set_actor(actor);
    req.mutable_fields()->set_first_name(first);
    return service->AddPerson(req).id();
  }

  std::string Link(const std::string& p1, const std::string& p2, const std::string& type) {
    v1::AddRelationshipRequest req;
    req.mutable_fields()->set_person1_id(p1);
    req.mutable_fields()->set_person2_id(p2);
    req.mutable_fields()->set_type(type);
    return service->AddRelationship(req).id();
  }

  std::size_t StoredPeople() {
    return writer->Load().people.size();
  }
};

void TestPersonLifecycleIsAuditedAndPersisted() {
  Harness h;

  v1::AddPersonRequest add;
  add.set_actor("alice");
  add.mutable_fields()->set_first_name("Ada");
  add.mutable_fields()->set_last_name("Lovelace");
  add.mutable_fields()->set_gender("FEMALE");
  (*add.mutable_fields()->mutable_attributes())["title"] = "Countess";
  const auto ada = h.service->AddPerson(add);

  assert(!ada.id().empty());
  assert(ada.full_name() == "Ada Lovelace");
  assert(ada.gender() == "female");
  assert(ada.attributes().at("title") == "Countess");
  assert(h.StoredPeople() == 1);
  assert(h.audit_out.str().find("actor=alice action=add_person id=" + ada.id()) != std::string::npos);

  v1::EditPersonRequest edit;
  edit.set_id(ada.id());
  edit.mutable_fields()->set_nickname("Enchantress of Numbers");
  edit.mutable_fields()->set_last_name("");
  const auto edited = h.service->EditPerson(edit);
  assert(edited.nickname() == "Enchantress of Numbers");
  assert(edited.last_name().empty());
  assert(edited.first_name() == "Ada");
  // empty actor is recorded as system
  assert(h.audit_out.str().find("actor=system action=edit_person") != std::string::npos);

  v1::GetPersonRequest get;
  get.set_id(ada.id());
  assert(h.service->GetPerson(get).nickname() == "Enchantress of Numbers");

  v1::DeletePersonRequest del;
  del.set_id(ada.id());
  assert(h.service->DeletePerson(del).relationships_removed() == 0);
  assert(h.StoredPeople() == 0);
  assert(Throws<util::NotFound>([&] { h.service->GetPerson(get); }));
}

void TestRejectedMutationsAreNotAudited() {
  Harness h;

  v1::AddPersonRequest add;
  add.mutable_fields()->set_last_name("Nameless");
  assert(Throws<util::ValidationError>([&] { h.service->AddPerson(add); }));
  assert(h.audit_out.str().empty());
  assert(h.StoredPeople() == 0);

  const auto a = h.AddPerson("A");
  v1::AddRelationshipRequest rel;
  rel.mutable_fields()->set_person1_id(a);
  rel.mutable_fields()->set_person2_id("missing");
  rel.mutable_fields()->set_type("parent");
  assert(Throws<util::NotFound>([&] { h.service->AddRelationship(rel); }));

  rel.mutable_fields()->set_person2_id(a);
  rel.mutable_fields()->set_type("nemesis");
  assert(Throws<util::ValidationError>([&] { h.service->AddRelationship(rel); }));

  assert(h.audit_out.str().find("add_relationship") == std::string::npos);
}

void TestRelationshipsAndListing() {
  Harness h;
  const auto mom = h.AddPerson("Mom");
  const auto kid = h.AddPerson("Kid");
  const auto pal = h.AddPerson("Pal");
  const auto parent_rel = h.Link(mom, kid, "Parent");
  h.Link(kid, pal, "friend");

  v1::ListRelationshipsRequest all;
  assert(h.service->ListRelationships(all).relationships_size() == 2);

  v1::ListRelationshipsRequest of_kid;
  of_kid.set_person_id(kid);
  assert(h.service->ListRelationships(of_kid).relationships_size() == 2);

  of_kid.set_type("parent");
  const auto parents = h.service->ListRelationships(of_kid);
  assert(parents.relationships_size() == 1);
  assert(parents.relationships(0).id() == parent_rel);
  assert(parents.relationships(0).type() == "parent");

  v1::ListRelationshipsRequest bad;
  bad.set_type("nemesis");
  assert(Throws<util::ValidationError>([&] { h.service->ListRelationships(bad); }));

  v1::EditRelationshipRequest edit;
  edit.set_id(parent_rel);
  edit.mutable_fields()->set_start_date("2001-02-03");
  assert(h.service->EditRelationship(edit).start_date() == "2001-02-03");

  v1::DeleteRelationshipRequest del;
  del.set_actor("bob");
  del.set_id(parent_rel);
  h.service->DeleteRelationship(del);
  assert(h.service->ListRelationships(all).relationships_size() == 1);
  assert(h.writer->Load().relationships.size() == 1);
  assert(h.audit_out.str().find("actor=bob action=delete_relationship id=" + parent_rel) != std::string::npos);

  v1::SearchPeopleRequest search;
  search.set_name("m");
  assert(h.service->SearchPeople(search).people_size() == 1);
  assert(h.service->ListPeople(v1::ListPeopleRequest{}).people_size() == 3);
}

void TestTraversalsThroughTheService() {
  Harness h;
  const auto gp  = h.AddPerson("Grandparent");
  const auto p   = h.AddPerson("Parent");
  const auto kid = h.AddPerson("Kid");
  const auto sib = h.AddPerson("Sibling");
  h.Link(gp, p, "parent");
  h.Link(p, kid, "parent");
  h.Link(p, sib, "parent");

  v1::TraversalRequest req;
  req.set_id(kid);
  req.set_depth(2);
  assert(h.service->Ancestors(req).people_size() == 2);
  assert(h.service->ExtendedFamily(req).people_size() == 2);
  assert(h.service->Related(req).people_size() == 3);

  req.set_id(gp);
  assert(h.service->Descendants(req).people_size() == 3);
  const auto branch = h.service->Branch(req);
  assert(branch.people_size() == 4);
  assert(branch.people(0).id() == gp);

  v1::SiblingsRequest siblings;
  siblings.set_id(kid);
  const auto sibs = h.service->Siblings(siblings);
  assert(sibs.people_size() == 1 && sibs.people(0).id() == sib);

  v1::PartialTreeRequest tree;
  tree.set_id(p);
  tree.set_depth(1);
  tree.set_only_descendants(true);
  const auto partial = h.service->PartialTree(tree);
  assert(partial.center().id() == p);
  assert(partial.ancestors_size() == 0);
  assert(partial.descendants_size() == 2);

  tree.set_only_ancestors(true);
  assert(Throws<util::ValidationError>([&] { h.service->PartialTree(tree); }));

  req.set_depth(-1);
  assert(Throws<util::ValidationError>([&] { h.service->Ancestors(req); }));
  req.set_id("missing");
  assert(Throws<util::NotFound>([&] { h.service->Ancestors(req); }));
}

void TestConsistencyDuplicatesAndMerge() {
  Harness h;
  const auto a  = h.AddPerson("Ada");
  const auto a2 = h.AddPerson("ada");
  const auto b  = h.AddPerson("Byron");
  h.Link(a, b, "parent");
  h.Link(b, a, "child");
  h.Link(a2, b, "parent");

  v1::CheckConsistencyRequest check;
  check.set_id(a);
  const auto issues = h.service->CheckConsistency(check);
  assert(issues.issues_size() == 1);
  assert(issues.issues(0).kind() == "redundant_reciprocal");
  assert(issues.issues(0).relationship_ids_size() == 2);

  const auto dups = h.service->FindDuplicates(v1::FindDuplicatesRequest{});
  assert(dups.candidates_size() == 1);
  assert(dups.candidates(0).first_id() == a);
  assert(dups.candidates(0).second_id() == a2);

  v1::MergePeopleRequest merge;
  merge.set_actor("carol");
  merge.set_keep_id(a);
  merge.set_remove_id(a2);
  const auto merged = h.service->MergePeople(merge);
  assert(merged.person().id() == a);
  assert(merged.relationships_dropped() == 1);
  assert(merged.relationships_rewritten() == 0);
  assert(h.StoredPeople() == 2);
  assert(h.audit_out.str().find("actor=carol action=merge_people keep_id=" + a) != std::string::npos);
}

void TestView() {
  Harness h;
  const auto a = h.AddPerson("A");
  const auto b = h.AddPerson("B");
  const auto c = h.AddPerson("C");
  h.Link(a, b, "parent");
  h.Link(b, a, "child");
  h.Link(b, c, "spouse");
  h.Link(c, b, "spouse");

  const auto whole = h.service->GetView(v1::GetViewRequest{});
  assert(whole.nodes_size() == 3);
  assert(whole.links_size() == 2);

  v1::GetViewRequest from_a;
  from_a.set_start_id(a);
  from_a.set_max_depth(1);
  const auto near = h.service->GetView(from_a);
  assert(near.nodes_size() == 2);
  assert(near.links_size() == 1);
  assert(near.links(0).type() == "parent_child");
  assert(near.links(0).source() == a);
}

void TestSearchFiltersAndViewPlaces() {
  Harness h;

  v1::AddPersonRequest add;
  add.mutable_fields()->set_first_name("Ada");
  add.mutable_fields()->set_gender("female");
  add.mutable_fields()->set_place_of_birth("London");
  add.mutable_fields()->set_place_of_death("Marylebone");
  (*add.mutable_fields()->mutable_attributes())["occupation"] = "mathematician";
  const auto ada = h.service->AddPerson(add).id();
  h.AddPerson("Ada");

  v1::SearchPeopleRequest everyone;
  assert(h.service->SearchPeople(everyone).people_size() == 2);

  v1::SearchPeopleRequest search;
  search.set_name("ada");
  search.set_place_of_birth("london");
  search.set_attribute_key("occupation");
  const auto found = h.service->SearchPeople(search);
  assert(found.people_size() == 1);
  assert(found.people(0).id() == ada);

  v1::SearchPeopleRequest bad;
  bad.set_death_date("yesterday");
  assert(Throws<util::ValidationError>([&] { h.service->SearchPeople(bad); }));

  v1::GetViewRequest view_req;
  view_req.set_start_id(ada);
  const auto view = h.service->GetView(view_req);
  assert(view.nodes_size() == 1);
  assert(view.nodes(0).place_of_birth() == "London");
  assert(view.nodes(0).place_of_death() == "Marylebone");
}

void TestRequiresGraph() {
  bool threw = false;
  try {
    famgraph::service::FamilyService service(famgraph::service::ServiceContext{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPersonLifecycleIsAuditedAndPersisted();
  TestRejectedMutationsAreNotAudited();
  TestRelationshipsAndListing();
  TestTraversalsThroughTheService();
  TestConsistencyDuplicatesAndMerge();
  TestView();
  TestSearchFiltersAndViewPlaces();
  TestRequiresGraph();

  std::cout << "famgraph_unit_family_service: pass\n";
  return 0;
}
