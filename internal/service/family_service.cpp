#include "family_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include "internal/audit/audit_log.hpp"
#include "internal/graph/consistency_checker.hpp"
#include "internal/graph/family_graph.hpp"
#include "internal/graph/traversal.hpp"
#include "internal/graph/view_projector.hpp"
#include "internal/persist/snapshot_writer.hpp"
#include "internal/util/errors.hpp"

namespace famgraph::service {

using namespace famgraph::v1;
using famgraph::observability::IntField;
using famgraph::observability::StringField;

namespace {

std::optional<std::string> Opt(bool has, const std::string& value) {
  if (!has) return std::nullopt;
  return value;
}

void CopyOptional(const std::optional<std::string>& from, std::string* to) {
  if (from) *to = *from;
}

famgraph::v1::Person ToProto(const model::Person& p) {
  famgraph::v1::Person out;
  out.set_id(p.id);
  out.set_first_name(p.first_name);
  out.set_last_name(p.last_name);
  CopyOptional(p.nickname, out.mutable_nickname());
  CopyOptional(p.birth_date, out.mutable_birth_date());
  CopyOptional(p.death_date, out.mutable_death_date());
  CopyOptional(p.place_of_birth, out.mutable_place_of_birth());
  CopyOptional(p.place_of_death, out.mutable_place_of_death());
  if (p.gender) out.set_gender(std::string(model::ToString(*p.gender)));
  CopyOptional(p.notes, out.mutable_notes());
  out.mutable_attributes()->insert(p.attributes.begin(), p.attributes.end());
  out.set_full_name(p.FullName());
  out.set_display_name(p.DisplayName());
  return out;
}

famgraph::v1::Relationship ToProto(const model::Relationship& r) {
  famgraph::v1::Relationship out;
  out.set_id(r.id);
  out.set_person1_id(r.person1_id);
  out.set_person2_id(r.person2_id);
  out.set_type(std::string(model::ToString(r.type)));
  CopyOptional(r.start_date, out.mutable_start_date());
  CopyOptional(r.end_date, out.mutable_end_date());
  CopyOptional(r.location, out.mutable_location());
  CopyOptional(r.notes, out.mutable_notes());
  out.mutable_attributes()->insert(r.attributes.begin(), r.attributes.end());
  return out;
}

model::PersonFields FromProto(const famgraph::v1::PersonFields& f) {
  model::PersonFields out;
  out.first_name     = Opt(f.has_first_name(), f.first_name());
  out.last_name      = Opt(f.has_last_name(), f.last_name());
  out.nickname       = Opt(f.has_nickname(), f.nickname());
  out.birth_date     = Opt(f.has_birth_date(), f.birth_date());
  out.death_date     = Opt(f.has_death_date(), f.death_date());
  out.place_of_birth = Opt(f.has_place_of_birth(), f.place_of_birth());
  out.place_of_death = Opt(f.has_place_of_death(), f.place_of_death());
  out.gender         = Opt(f.has_gender(), f.gender());
  out.notes          = Opt(f.has_notes(), f.notes());
  out.attributes.insert(f.attributes().begin(), f.attributes().end());
  return out;
}

model::RelationshipFields FromProto(const famgraph::v1::RelationshipFields& f) {
  model::RelationshipFields out;
  out.person1_id = Opt(f.has_person1_id(), f.person1_id());
  out.person2_id = Opt(f.has_person2_id(), f.person2_id());
  out.type       = Opt(f.has_type(), f.type());
  out.start_date = Opt(f.has_start_date(), f.start_date());
  out.end_date   = Opt(f.has_end_date(), f.end_date());
  out.location   = Opt(f.has_location(), f.location());
  out.notes      = Opt(f.has_notes(), f.notes());
  out.attributes.insert(f.attributes().begin(), f.attributes().end());
  return out;
}

PeopleResponse ToPeople(const std::vector<model::Person>& people) {
  PeopleResponse resp;
  for (const auto& p : people) {
    *resp.add_people() = ToProto(p);
  }
  return resp;
}

std::string ActorOf(const std::string& actor) {
  return actor.empty() ? "system" : actor;
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
    FAMGRAPH_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), StringField("id", subject_id),
                                      IntField("elapsed_ms", static_cast<std::int64_t>(elapsed_ms))});
    throw;
  }
}

} // namespace

FamilyService::FamilyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.graph) throw std::invalid_argument("FamilyService requires a graph");
}

void FamilyService::Audit(const std::string& actor, std::string_view action, std::initializer_list<observability::LogField> detail) {
  if (ctx_.audit) ctx_.audit->Record(ActorOf(actor), action, detail);
}

void FamilyService::PersistCommitted() {
  if (ctx_.writer) ctx_.writer->Persist(ctx_.graph->Snapshot());
}

// ------------------------------------------------------------------
// People
// ------------------------------------------------------------------

famgraph::v1::Person FamilyService::AddPerson(const AddPersonRequest& req) {
  return ObserveRpc("FamilyService.AddPerson", "", [&] {
    auto person = ctx_.graph->AddPerson(FromProto(req.fields()));
    Audit(req.actor(), "add_person", {StringField("id", person.id), StringField("name", person.FullName())});
    PersistCommitted();
    return ToProto(person);
  });
}

famgraph::v1::Person FamilyService::GetPerson(const GetPersonRequest& req) {
  return ObserveRpc("FamilyService.GetPerson", req.id(), [&] { return ToProto(ctx_.graph->GetPerson(req.id())); });
}

famgraph::v1::Person FamilyService::EditPerson(const EditPersonRequest& req) {
  return ObserveRpc("FamilyService.EditPerson", req.id(), [&] {
    auto person = ctx_.graph->EditPerson(req.id(), FromProto(req.fields()));
    Audit(req.actor(), "edit_person", {StringField("id", person.id)});
    PersistCommitted();
    return ToProto(person);
  });
}

DeletePersonResponse FamilyService::DeletePerson(const DeletePersonRequest& req) {
  return ObserveRpc("FamilyService.DeletePerson", req.id(), [&] {
    const auto removed = ctx_.graph->DeletePerson(req.id());
    Audit(req.actor(), "delete_person", {StringField("id", req.id()), IntField("relationships_removed", static_cast<std::int64_t>(removed))});
    PersistCommitted();

    DeletePersonResponse resp;
    resp.set_relationships_removed(static_cast<uint32_t>(removed));
    return resp;
  });
}

PeopleResponse FamilyService::ListPeople(const ListPeopleRequest&) {
  return ObserveRpc("FamilyService.ListPeople", "", [&] { return ToPeople(ctx_.graph->ListPeople()); });
}

PeopleResponse FamilyService::SearchPeople(const SearchPeopleRequest& req) {
  return ObserveRpc("FamilyService.SearchPeople", "", [&] {
    model::PersonQuery query;
    query.name            = Opt(req.has_name(), req.name());
    query.birth_date      = Opt(req.has_birth_date(), req.birth_date());
    query.death_date      = Opt(req.has_death_date(), req.death_date());
    query.gender          = Opt(req.has_gender(), req.gender());
    query.place_of_birth  = Opt(req.has_place_of_birth(), req.place_of_birth());
    query.place_of_death  = Opt(req.has_place_of_death(), req.place_of_death());
    query.notes           = Opt(req.has_notes(), req.notes());
    query.attribute_key   = Opt(req.has_attribute_key(), req.attribute_key());
    query.attribute_value = Opt(req.has_attribute_value(), req.attribute_value());
    return ToPeople(ctx_.graph->SearchPeople(query));
  });
}

// ------------------------------------------------------------------
// Relationships
// ------------------------------------------------------------------

famgraph::v1::Relationship FamilyService::AddRelationship(const AddRelationshipRequest& req) {
  return ObserveRpc("FamilyService.AddRelationship", "", [&] {
    auto rel = ctx_.graph->AddRelationship(FromProto(req.fields()));
    Audit(req.actor(), "add_relationship", {StringField("id", rel.id), StringField("person1_id", rel.person1_id),
                                            StringField("person2_id", rel.person2_id), StringField("type", model::ToString(rel.type))});
    PersistCommitted();
    return ToProto(rel);
  });
}

famgraph::v1::Relationship FamilyService::EditRelationship(const EditRelationshipRequest& req) {
  return ObserveRpc("FamilyService.EditRelationship", req.id(), [&] {
    auto rel = ctx_.graph->EditRelationship(req.id(), FromProto(req.fields()));
    Audit(req.actor(), "edit_relationship", {StringField("id", rel.id), StringField("type", model::ToString(rel.type))});
    PersistCommitted();
    return ToProto(rel);
  });
}

void FamilyService::DeleteRelationship(const DeleteRelationshipRequest& req) {
  ObserveRpc("FamilyService.DeleteRelationship", req.id(), [&] {
    ctx_.graph->DeleteRelationship(req.id());
    Audit(req.actor(), "delete_relationship", {StringField("id", req.id())});
    PersistCommitted();
  });
}

RelationshipsResponse FamilyService::ListRelationships(const ListRelationshipsRequest& req) {
  return ObserveRpc("FamilyService.ListRelationships", req.person_id(), [&] {
    std::optional<model::RelationshipType> type;
    if (!req.type().empty()) {
      type = model::ParseRelationshipType(req.type());
      if (!type) throw util::ValidationError("unknown relationship type: " + req.type());
    }

    auto rels = req.person_id().empty() ? (type ? ctx_.graph->FindRelationshipsByType(*type) : ctx_.graph->ListRelationships())
                                        : ctx_.graph->RelationshipsOf(req.person_id());

    RelationshipsResponse resp;
    for (const auto& r : rels) {
      if (type && r.type != *type) continue;
      *resp.add_relationships() = ToProto(r);
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Traversal
// ------------------------------------------------------------------

PeopleResponse FamilyService::Ancestors(const TraversalRequest& req) {
  return ObserveRpc("FamilyService.Ancestors", req.id(),
                    [&] { return ToPeople(graph::GraphTraversal(*ctx_.graph).Ancestors(req.id(), req.depth())); });
}

PeopleResponse FamilyService::Descendants(const TraversalRequest& req) {
  return ObserveRpc("FamilyService.Descendants", req.id(),
                    [&] { return ToPeople(graph::GraphTraversal(*ctx_.graph).Descendants(req.id(), req.depth())); });
}

PeopleResponse FamilyService::Siblings(const SiblingsRequest& req) {
  return ObserveRpc("FamilyService.Siblings", req.id(), [&] { return ToPeople(graph::GraphTraversal(*ctx_.graph).Siblings(req.id())); });
}

PeopleResponse FamilyService::ExtendedFamily(const TraversalRequest& req) {
  return ObserveRpc("FamilyService.ExtendedFamily", req.id(),
                    [&] { return ToPeople(graph::GraphTraversal(*ctx_.graph).ExtendedFamily(req.id(), req.depth())); });
}

PeopleResponse FamilyService::Related(const TraversalRequest& req) {
  return ObserveRpc("FamilyService.Related", req.id(),
                    [&] { return ToPeople(graph::GraphTraversal(*ctx_.graph).Related(req.id(), req.depth())); });
}

PeopleResponse FamilyService::Branch(const TraversalRequest& req) {
  return ObserveRpc("FamilyService.Branch", req.id(), [&] { return ToPeople(graph::GraphTraversal(*ctx_.graph).Branch(req.id(), req.depth())); });
}

PartialTreeResponse FamilyService::PartialTree(const PartialTreeRequest& req) {
  return ObserveRpc("FamilyService.PartialTree", req.id(), [&] {
    auto tree = graph::GraphTraversal(*ctx_.graph).BuildPartialTree(req.id(), req.depth(), req.only_ancestors(), req.only_descendants());

    PartialTreeResponse resp;
    *resp.mutable_center() = ToProto(tree.center);
    for (const auto& p : tree.ancestors) *resp.add_ancestors() = ToProto(p);
    for (const auto& p : tree.descendants) *resp.add_descendants() = ToProto(p);
    return resp;
  });
}

// ------------------------------------------------------------------
// Consistency
// ------------------------------------------------------------------

CheckConsistencyResponse FamilyService::CheckConsistency(const CheckConsistencyRequest& req) {
  return ObserveRpc("FamilyService.CheckConsistency", req.id(), [&] {
    CheckConsistencyResponse resp;
    for (const auto& issue : graph::ConsistencyChecker(*ctx_.graph).Check(req.id())) {
      auto* out = resp.add_issues();
      out->set_kind(std::string(graph::ToString(issue.kind)));
      out->set_person_id(issue.person_id);
      for (const auto& id : issue.relationship_ids) out->add_relationship_ids(id);
      out->set_message(issue.message);
    }
    return resp;
  });
}

FindDuplicatesResponse FamilyService::FindDuplicates(const FindDuplicatesRequest&) {
  return ObserveRpc("FamilyService.FindDuplicates", "", [&] {
    FindDuplicatesResponse resp;
    for (const auto& candidate : graph::ConsistencyChecker(*ctx_.graph).FindDuplicates(ctx_.duplicates)) {
      auto* out = resp.add_candidates();
      out->set_first_id(candidate.first_id);
      out->set_second_id(candidate.second_id);
      out->set_birth_date_compared(candidate.birth_date_compared);
    }
    return resp;
  });
}

MergePeopleResponse FamilyService::MergePeople(const MergePeopleRequest& req) {
  return ObserveRpc("FamilyService.MergePeople", req.keep_id(), [&] {
    auto result = graph::ConsistencyChecker(*ctx_.graph).Merge(req.keep_id(), req.remove_id());
    Audit(req.actor(), "merge_people", {StringField("keep_id", req.keep_id()), StringField("remove_id", req.remove_id()),
                                        IntField("rewritten", static_cast<std::int64_t>(result.relationships_rewritten)),
                                        IntField("dropped", static_cast<std::int64_t>(result.relationships_dropped))});
    PersistCommitted();

    MergePeopleResponse resp;
    *resp.mutable_person() = ToProto(result.person);
    resp.set_relationships_rewritten(static_cast<uint32_t>(result.relationships_rewritten));
    resp.set_relationships_dropped(static_cast<uint32_t>(result.relationships_dropped));
    return resp;
  });
}

// ------------------------------------------------------------------
// View
// ------------------------------------------------------------------

GraphView FamilyService::GetView(const GetViewRequest& req) {
  return ObserveRpc("FamilyService.GetView", req.start_id(), [&] {
    std::optional<std::string> start;
    if (req.has_start_id() && !req.start_id().empty()) start = req.start_id();
    std::optional<int> depth;
    if (req.has_max_depth()) depth = req.max_depth();

    auto view = graph::ViewProjector(*ctx_.graph, ctx_.default_view_depth).Project(start, depth);

    GraphView resp;
    for (const auto& node : view.nodes) {
      auto* out = resp.add_nodes();
      out->set_id(node.id);
      out->set_label(node.label);
      out->set_full_name(node.full_name);
      CopyOptional(node.gender, out->mutable_gender());
      CopyOptional(node.birth_date, out->mutable_birth_date());
      CopyOptional(node.death_date, out->mutable_death_date());
      CopyOptional(node.place_of_birth, out->mutable_place_of_birth());
      CopyOptional(node.place_of_death, out->mutable_place_of_death());
    }
    for (const auto& link : view.links) {
      auto* out = resp.add_links();
      out->set_id(link.id);
      out->set_source(link.source);
      out->set_target(link.target);
      out->set_type(link.type);
    }
    return resp;
  });
}

} // namespace famgraph::service
