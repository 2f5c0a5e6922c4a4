#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

namespace engram::store::qdrant {

/*
  Converts a failed gRPC status into the matching util:: exception.
  No-op for an OK status.
*/
void ThrowIfError(const ::grpc::Status& status, std::string_view operation);

} // namespace engram::store::qdrant
