#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace famgraph::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    NotFound          -> NOT_FOUND
    ValidationError   -> INVALID_ARGUMENT
    DuplicateEdge     -> ALREADY_EXISTS
    ResourceExhausted -> RESOURCE_EXHAUSTED
    PersistenceError  -> UNAVAILABLE
    anything else     -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace famgraph::grpc
