#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace kag::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace kag::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NoContent*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  // BuildTimeout before its base
  if (dynamic_cast<const BuildTimeout*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const BuildError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace kag::grpc
