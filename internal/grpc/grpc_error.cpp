#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace famgraph::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace famgraph::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const DuplicateEdge*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  // the mutation is live in memory; the client decides whether to retry
  if (dynamic_cast<const PersistenceError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace famgraph::grpc
