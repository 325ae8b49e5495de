#include "family_server.hpp"
#include "grpc_error.hpp"

namespace famgraph::grpc {

using namespace famgraph::v1;

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

FamilyServer::FamilyServer(std::shared_ptr<famgraph::service::FamilyService> svc)
    : service_(std::move(svc)) {}

::grpc::Status FamilyServer::AddPerson(::grpc::ServerContext*, const AddPersonRequest* req, Person* resp) {
  return Invoke([&] { *resp = service_->AddPerson(*req); });
}

::grpc::Status FamilyServer::GetPerson(::grpc::ServerContext*, const GetPersonRequest* req, Person* resp) {
  return Invoke([&] { *resp = service_->GetPerson(*req); });
}

::grpc::Status FamilyServer::EditPerson(::grpc::ServerContext*, const EditPersonRequest* req, Person* resp) {
  return Invoke([&] { *resp = service_->EditPerson(*req); });
}

::grpc::Status FamilyServer::DeletePerson(::grpc::ServerContext*, const DeletePersonRequest* req, DeletePersonResponse* resp) {
  return Invoke([&] { *resp = service_->DeletePerson(*req); });
}

::grpc::Status FamilyServer::ListPeople(::grpc::ServerContext*, const ListPeopleRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->ListPeople(*req); });
}

::grpc::Status FamilyServer::SearchPeople(::grpc::ServerContext*, const SearchPeopleRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->SearchPeople(*req); });
}

::grpc::Status FamilyServer::AddRelationship(::grpc::ServerContext*, const AddRelationshipRequest* req, Relationship* resp) {
  return Invoke([&] { *resp = service_->AddRelationship(*req); });
}

::grpc::Status FamilyServer::EditRelationship(::grpc::ServerContext*, const EditRelationshipRequest* req, Relationship* resp) {
  return Invoke([&] { *resp = service_->EditRelationship(*req); });
}

::grpc::Status FamilyServer::DeleteRelationship(::grpc::ServerContext*, const DeleteRelationshipRequest* req, Empty*) {
  return Invoke([&] { service_->DeleteRelationship(*req); });
}

::grpc::Status FamilyServer::ListRelationships(::grpc::ServerContext*, const ListRelationshipsRequest* req, RelationshipsResponse* resp) {
  return Invoke([&] { *resp = service_->ListRelationships(*req); });
}

::grpc::Status FamilyServer::Ancestors(::grpc::ServerContext*, const TraversalRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->Ancestors(*req); });
}

::grpc::Status FamilyServer::Descendants(::grpc::ServerContext*, const TraversalRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->Descendants(*req); });
}

::grpc::Status FamilyServer::Siblings(::grpc::ServerContext*, const SiblingsRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->Siblings(*req); });
}

::grpc::Status FamilyServer::ExtendedFamily(::grpc::ServerContext*, const TraversalRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->ExtendedFamily(*req); });
}

::grpc::Status FamilyServer::Related(::grpc::ServerContext*, const TraversalRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->Related(*req); });
}

::grpc::Status FamilyServer::Branch(::grpc::ServerContext*, const TraversalRequest* req, PeopleResponse* resp) {
  return Invoke([&] { *resp = service_->Branch(*req); });
}

::grpc::Status FamilyServer::PartialTree(::grpc::ServerContext*, const PartialTreeRequest* req, PartialTreeResponse* resp) {
  return Invoke([&] { *resp = service_->PartialTree(*req); });
}

::grpc::Status FamilyServer::CheckConsistency(::grpc::ServerContext*, const CheckConsistencyRequest* req, CheckConsistencyResponse* resp) {
  return Invoke([&] { *resp = service_->CheckConsistency(*req); });
}

::grpc::Status FamilyServer::FindDuplicates(::grpc::ServerContext*, const FindDuplicatesRequest* req, FindDuplicatesResponse* resp) {
  return Invoke([&] { *resp = service_->FindDuplicates(*req); });
}

::grpc::Status FamilyServer::MergePeople(::grpc::ServerContext*, const MergePeopleRequest* req, MergePeopleResponse* resp) {
  return Invoke([&] { *resp = service_->MergePeople(*req); });
}

::grpc::Status FamilyServer::GetView(::grpc::ServerContext*, const GetViewRequest* req, GraphView* resp) {
  return Invoke([&] { *resp = service_->GetView(*req); });
}

}
