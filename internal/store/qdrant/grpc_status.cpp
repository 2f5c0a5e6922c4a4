#include "grpc_status.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace engram::store::qdrant {

void ThrowIfError(const ::grpc::Status& status, std::string_view operation) {
  if (status.ok()) {
    return;
  }

  const std::string message = std::string(operation) + ": " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::CANCELLED:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      throw util::Cancelled(message);
    case ::grpc::StatusCode::UNAVAILABLE:
      throw util::ConnectionFailed(message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      throw util::InvalidArgument(message);
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw util::AlreadyExists(message);
    default:
      throw util::StoreError(message);
  }
}

} // namespace engram::store::qdrant
