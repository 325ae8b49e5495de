#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

namespace famgraph::runtime {

/*
  Owns the grpc::Server and the services registered on it.

  Services must be added before Start(). Shutdown() waits up to `grace` for
  in-flight calls, then cancels the rest.
*/
class Server {
public:
  explicit Server(std::string bind_address);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void AddService(std::shared_ptr<::grpc::Service> service);

  // Returns the bound port (useful with ":0").
  int Start();
  void Wait();
  void Shutdown(std::chrono::milliseconds grace = std::chrono::seconds(5));

private:
  std::string bind_address_;
  std::vector<std::shared_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> server_;
};

} // namespace famgraph::runtime
