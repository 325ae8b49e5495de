#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/family_graph.hpp"
#include "internal/grpc/family_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/persist/snapshot_writer.hpp"
#include "internal/service/family_service.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1   = famgraph::v1;
namespace util = famgraph::util;

struct Fixture {
  famgraph::graph::TraversalLimits         limits{64, 3};
  std::shared_ptr<famgraph::graph::FamilyGraph> graph = std::make_shared<famgraph::graph::FamilyGraph>(limits);
  std::unique_ptr<famgraph::grpc::FamilyServer> server;

  Fixture() {
    famgraph::service::ServiceContext ctx;
    ctx.graph  = graph;
    ctx.writer = std::make_shared<famgraph::persist::SnapshotWriter>(std::make_shared<famgraph::db::memory::MemoryRepository>(),
                                                                     famgraph::persist::PersistenceMode::kSync);
    server = std::make_unique<famgraph::grpc::FamilyServer>(std::make_shared<famgraph::service::FamilyService>(ctx));
  }

  std::string Add(const std::string& first) {
    v1::AddPersonRequest req;
    req.mutable_fields()->set_first_name(first);
    v1::Person resp;
    ::grpc::ServerContext ctx;
    const auto status = server->AddPerson(&ctx, &req, &resp);
    assert(status.ok());
    return resp.id();
  }

  ::grpc::Status Link(const std::string& p1, const std::string& p2, const std::string& type) {
    v1::AddRelationshipRequest req;
    req.mutable_fields()->set_person1_id(p1);
    req.mutable_fields()->set_person2_id(p2);
    req.mutable_fields()->set_type(type);
    v1::Relationship resp;
    ::grpc::ServerContext ctx;
    return server->AddRelationship(&ctx, &req, &resp);
  }
};

void TestExceptionMapping() {
  using ::grpc::StatusCode;
  using famgraph::grpc::ToStatus;

  assert(ToStatus(util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(ToStatus(util::ValidationError("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(util::DuplicateEdge("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(ToStatus(util::ResourceExhausted("x")).error_code() == StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(util::PersistenceError("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);
  assert(ToStatus(util::NotFound("person not found: 42")).error_message() == "person not found: 42");
}

void TestGetMissingPersonReturnsNotFound() {
  Fixture f;
  v1::GetPersonRequest req;
  req.set_id("missing");
  v1::Person resp;
  ::grpc::ServerContext ctx;

  assert(f.server->GetPerson(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRelationshipErrors() {
  Fixture f;
  const auto a = f.Add("A");
  const auto b = f.Add("B");

  assert(f.Link(a, b, "parent").ok());
  assert(f.Link(a, b, "parent").error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(f.Link(a, a, "spouse").error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(f.Link(a, b, "nemesis").error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(f.Link(a, "missing", "spouse").error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestTraversalCeilingReturnsResourceExhausted() {
  Fixture f;
  const auto root = f.Add("Root");
  for (int i = 0; i < 4; ++i) assert(f.Link(root, f.Add("Child"), "parent").ok());

  v1::TraversalRequest req;
  req.set_id(root);
  req.set_depth(1);
  v1::PeopleResponse resp;
  ::grpc::ServerContext ctx;
  assert(f.server->Descendants(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);

  req.set_depth(65);
  ::grpc::ServerContext ctx2;
  assert(f.server->Related(&ctx2, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestGetMissingPersonReturnsNotFound();
  TestRelationshipErrors();
  TestTraversalCeilingReturnsResourceExhausted();

  std::cout << "famgraph_unit_grpc_status: pass\n";
  return 0;
}
