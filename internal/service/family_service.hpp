#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

#include "famgraph/v1.hpp"
#include "internal/observability/logging.hpp"
#include "service_context.hpp"

namespace famgraph::service {

/*
  Protobuf facade over the family graph.

  Each call logs failures with its route. Mutations are recorded in the audit
  log under the request's actor ("system" when empty) and then persisted.
*/
class FamilyService {
public:
  explicit FamilyService(ServiceContext ctx);

  famgraph::v1::Person AddPerson(const famgraph::v1::AddPersonRequest& req);
  famgraph::v1::Person GetPerson(const famgraph::v1::GetPersonRequest& req);
  famgraph::v1::Person EditPerson(const famgraph::v1::EditPersonRequest& req);
  famgraph::v1::DeletePersonResponse DeletePerson(const famgraph::v1::DeletePersonRequest& req);
  famgraph::v1::PeopleResponse ListPeople(const famgraph::v1::ListPeopleRequest& req);
  famgraph::v1::PeopleResponse SearchPeople(const famgraph::v1::SearchPeopleRequest& req);

  famgraph::v1::Relationship AddRelationship(const famgraph::v1::AddRelationshipRequest& req);
  famgraph::v1::Relationship EditRelationship(const famgraph::v1::EditRelationshipRequest& req);
  void DeleteRelationship(const famgraph::v1::DeleteRelationshipRequest& req);
  famgraph::v1::RelationshipsResponse ListRelationships(const famgraph::v1::ListRelationshipsRequest& req);

  famgraph::v1::PeopleResponse Ancestors(const famgraph::v1::TraversalRequest& req);
  famgraph::v1::PeopleResponse Descendants(const famgraph::v1::TraversalRequest& req);
  famgraph::v1::PeopleResponse Siblings(const famgraph::v1::SiblingsRequest& req);
  famgraph::v1::PeopleResponse ExtendedFamily(const famgraph::v1::TraversalRequest& req);
  famgraph::v1::PeopleResponse Related(const famgraph::v1::TraversalRequest& req);
  famgraph::v1::PeopleResponse Branch(const famgraph::v1::TraversalRequest& req);
  famgraph::v1::PartialTreeResponse PartialTree(const famgraph::v1::PartialTreeRequest& req);

  famgraph::v1::CheckConsistencyResponse CheckConsistency(const famgraph::v1::CheckConsistencyRequest& req);
  famgraph::v1::FindDuplicatesResponse FindDuplicates(const famgraph::v1::FindDuplicatesRequest& req);
  famgraph::v1::MergePeopleResponse MergePeople(const famgraph::v1::MergePeopleRequest& req);

  famgraph::v1::GraphView GetView(const famgraph::v1::GetViewRequest& req);

private:
  void Audit(const std::string& actor, std::string_view action, std::initializer_list<observability::LogField> detail);
  void PersistCommitted();

  ServiceContext ctx_;
};

}
