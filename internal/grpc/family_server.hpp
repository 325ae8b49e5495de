#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "famgraph/v1/family_service.grpc.pb.h"
#include "internal/service/family_service.hpp"

namespace famgraph::grpc {

class FamilyServer final : public famgraph::v1::FamilyGraphService::Service {
public:
  explicit FamilyServer(std::shared_ptr<famgraph::service::FamilyService> svc);

  ::grpc::Status AddPerson(::grpc::ServerContext*, const famgraph::v1::AddPersonRequest*, famgraph::v1::Person*) override;
  ::grpc::Status GetPerson(::grpc::ServerContext*, const famgraph::v1::GetPersonRequest*, famgraph::v1::Person*) override;
  ::grpc::Status EditPerson(::grpc::ServerContext*, const famgraph::v1::EditPersonRequest*, famgraph::v1::Person*) override;
  ::grpc::Status DeletePerson(::grpc::ServerContext*, const famgraph::v1::DeletePersonRequest*,
                              famgraph::v1::DeletePersonResponse*) override;
  ::grpc::Status ListPeople(::grpc::ServerContext*, const famgraph::v1::ListPeopleRequest*, famgraph::v1::PeopleResponse*) override;
  ::grpc::Status SearchPeople(::grpc::ServerContext*, const famgraph::v1::SearchPeopleRequest*, famgraph::v1::PeopleResponse*) override;

  ::grpc::Status AddRelationship(::grpc::ServerContext*, const famgraph::v1::AddRelationshipRequest*,
                                 famgraph::v1::Relationship*) override;
  ::grpc::Status EditRelationship(::grpc::ServerContext*, const famgraph::v1::EditRelationshipRequest*,
                                  famgraph::v1::Relationship*) override;
  ::grpc::Status DeleteRelationship(::grpc::ServerContext*, const famgraph::v1::DeleteRelationshipRequest*,
                                    famgraph::v1::Empty*) override;
  ::grpc::Status ListRelationships(::grpc::ServerContext*, const famgraph::v1::ListRelationshipsRequest*,
                                   famgraph::v1::RelationshipsResponse*) override;

  ::grpc::Status Ancestors(::grpc::ServerContext*, const famgraph::v1::TraversalRequest*, famgraph::v1::PeopleResponse*) override;
  ::grpc::Status Descendants(::grpc::ServerContext*, const famgraph::v1::TraversalRequest*, famgraph::v1::PeopleResponse*) override;
  ::grpc::Status Siblings(::grpc::ServerContext*, const famgraph::v1::SiblingsRequest*, famgraph::v1::PeopleResponse*) override;
  ::grpc::Status ExtendedFamily(::grpc::ServerContext*, const famgraph::v1::TraversalRequest*, famgraph::v1::PeopleResponse*) override;
  ::grpc::Status Related(::grpc::ServerContext*, const famgraph::v1::TraversalRequest*, famgraph::v1::PeopleResponse*) override;
  ::grpc::Status Branch(::grpc::ServerContext*, const famgraph::v1::TraversalRequest*, famgraph::v1::PeopleResponse*) override;
  ::grpc::Status PartialTree(::grpc::ServerContext*, const famgraph::v1::PartialTreeRequest*,
                             famgraph::v1::PartialTreeResponse*) override;

  ::grpc::Status CheckConsistency(::grpc::ServerContext*, const famgraph::v1::CheckConsistencyRequest*,
                                  famgraph::v1::CheckConsistencyResponse*) override;
  ::grpc::Status FindDuplicates(::grpc::ServerContext*, const famgraph::v1::FindDuplicatesRequest*,
                                famgraph::v1::FindDuplicatesResponse*) override;
  ::grpc::Status MergePeople(::grpc::ServerContext*, const famgraph::v1::MergePeopleRequest*,
                             famgraph::v1::MergePeopleResponse*) override;

  ::grpc::Status GetView(::grpc::ServerContext*, const famgraph::v1::GetViewRequest*, famgraph::v1::GraphView*) override;

private:
  std::shared_ptr<famgraph::service::FamilyService> service_;
};

}
