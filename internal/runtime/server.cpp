#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace famgraph::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(std::string bind_address) : bind_address_(std::move(bind_address)) {}

Server::~Server() {
  Shutdown(std::chrono::milliseconds(0));
}

void Server::AddService(std::shared_ptr<::grpc::Service> service) {
  if (server_) throw std::logic_error("services must be added before Start()");
  services_.push_back(std::move(service));
}

int Server::Start() {
  ::grpc::ServerBuilder builder;

  int port = 0;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port);
  for (const auto& service : services_) builder.RegisterService(service.get());

  server_ = builder.BuildAndStart();
  if (!server_ || port == 0) {
    server_.reset();
    throw std::runtime_error("cannot listen on " + bind_address_);
  }

  FAMGRAPH_LOG_INFO("gRPC server listening", {StringField("bind_address", bind_address_), IntField("port", port),
                                              IntField("services", static_cast<std::int64_t>(services_.size()))});
  return port;
}

void Server::Wait() {
  if (server_) server_->Wait();
}

void Server::Shutdown(std::chrono::milliseconds grace) {
  if (!server_) return;
  server_->Shutdown(std::chrono::system_clock::now() + grace);
  server_.reset();
}

} // namespace famgraph::runtime
