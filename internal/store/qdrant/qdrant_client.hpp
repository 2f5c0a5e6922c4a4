#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/store/call_context.hpp"
#include "qdrant/collections_service.grpc.pb.h"
#include "qdrant/points_service.grpc.pb.h"
#include "qdrant/qdrant.grpc.pb.h"

namespace engram::store::qdrant {

/*
  Synchronous client for the vector service's gRPC API.

  Every call honors the CallContext: its deadline becomes the RPC
  deadline and a stop request cancels the in-flight RPC. Failures are
  raised as util:: exceptions; nothing is retried.
*/
class QdrantClient {
 public:
  explicit QdrantClient(std::shared_ptr<::grpc::Channel> channel);

  // "http://host:6333" -> "host:6334". The REST port maps to the gRPC
  // port; any other explicit port is kept; no port means 6334.
  static std::string GrpcTarget(const std::string& url);

  // Throws util::ConnectionFailed when the service does not answer within
  // timeout.
  void HealthCheck(std::chrono::milliseconds timeout) const;

  bool CollectionExists(const CallContext& ctx, const std::string& collection) const;
  void CreateCollection(const CallContext& ctx, const std::string& collection, std::uint64_t dim) const;

  void Upsert(const CallContext& ctx, const std::string& collection, ::qdrant::PointStruct point) const;
  void DeletePoint(const CallContext& ctx, const std::string& collection, std::uint64_t id) const;

  std::vector<::qdrant::RetrievedPoint> Get(const CallContext& ctx, const std::string& collection,
                                            std::uint64_t id, bool with_payload) const;

  std::vector<::qdrant::ScoredPoint> Search(const CallContext& ctx, const std::string& collection,
                                            const std::vector<float>& vector, const ::qdrant::Filter& filter,
                                            std::uint64_t limit) const;

  std::vector<::qdrant::RetrievedPoint> Scroll(const CallContext& ctx, const std::string& collection,
                                               const ::qdrant::Filter& filter, std::uint32_t limit) const;

 private:
  std::shared_ptr<::grpc::Channel>               channel_;
  std::unique_ptr<::qdrant::Qdrant::Stub>        health_;
  std::unique_ptr<::qdrant::Collections::Stub>   collections_;
  std::unique_ptr<::qdrant::Points::Stub>        points_;
};

} // namespace engram::store::qdrant
