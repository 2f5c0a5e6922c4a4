#include "qdrant_client.hpp"

#include <grpcpp/client_context.h>

#include <algorithm>
#include <stop_token>
#include <utility>

#include "internal/store/qdrant/grpc_status.hpp"
#include "internal/util/errors.hpp"

namespace engram::store::qdrant {

namespace {

constexpr int kRestPort = 6333;
constexpr int kGrpcPort = 6334;

constexpr std::uint32_t kScrollPageSize = 1000;

// Runs one RPC under ctx: deadline forwarded, stop request -> TryCancel.
template <typename Call>
void Invoke(const CallContext& ctx, const char* operation, Call&& call) {
  ctx.ThrowIfCancelled(operation);

  ::grpc::ClientContext context;
  if (ctx.deadline) {
    context.set_deadline(*ctx.deadline);
  }
  std::stop_callback on_stop(ctx.stop, [&context] { context.TryCancel(); });

  ThrowIfError(call(&context), operation);
}

::qdrant::PointId NumId(std::uint64_t id) {
  ::qdrant::PointId point_id;
  point_id.set_num(id);
  return point_id;
}

} // namespace

QdrantClient::QdrantClient(std::shared_ptr<::grpc::Channel> channel)
    : channel_(std::move(channel)),
      health_(::qdrant::Qdrant::NewStub(channel_)),
      collections_(::qdrant::Collections::NewStub(channel_)),
      points_(::qdrant::Points::NewStub(channel_)) {}

std::string QdrantClient::GrpcTarget(const std::string& url) {
  std::string rest = url;
  if (auto scheme = rest.find("://"); scheme != std::string::npos) {
    rest = rest.substr(scheme + 3);
  }
  if (auto slash = rest.find('/'); slash != std::string::npos) {
    rest = rest.substr(0, slash);
  }
  if (rest.empty()) {
    throw util::InvalidArgument("qdrant url has no host: \"" + url + "\"");
  }

  std::string host = rest;
  int         port = kGrpcPort;
  if (auto colon = rest.rfind(':'); colon != std::string::npos && rest.find(']', colon) == std::string::npos) {
    host = rest.substr(0, colon);
    try {
      port = std::stoi(rest.substr(colon + 1));
    } catch (const std::exception&) {
      throw util::InvalidArgument("qdrant url has an invalid port: \"" + url + "\"");
    }
    if (port == kRestPort) {
      port = kGrpcPort;
    }
  }
  return host + ":" + std::to_string(port);
}

void QdrantClient::HealthCheck(std::chrono::milliseconds timeout) const {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout);

  ::qdrant::HealthCheckRequest req;
  ::qdrant::HealthCheckReply   resp;
  const auto                   status = health_->HealthCheck(&context, req, &resp);
  if (!status.ok()) {
    throw util::ConnectionFailed("qdrant health check: " + status.error_message());
  }
}

bool QdrantClient::CollectionExists(const CallContext& ctx, const std::string& collection) const {
  ::qdrant::CollectionExistsRequest  req;
  ::qdrant::CollectionExistsResponse resp;
  req.set_collection_name(collection);

  Invoke(ctx, "collection exists", [&](::grpc::ClientContext* context) {
    return collections_->CollectionExists(context, req, &resp);
  });
  return resp.result().exists();
}

void QdrantClient::CreateCollection(const CallContext& ctx, const std::string& collection, std::uint64_t dim) const {
  ::qdrant::CreateCollection            req;
  ::qdrant::CollectionOperationResponse resp;
  req.set_collection_name(collection);
  auto* params = req.mutable_vectors_config()->mutable_params();
  params->set_size(dim);
  params->set_distance(::qdrant::Distance::Cosine);

  Invoke(ctx, "create collection", [&](::grpc::ClientContext* context) {
    return collections_->Create(context, req, &resp);
  });
}

void QdrantClient::Upsert(const CallContext& ctx, const std::string& collection, ::qdrant::PointStruct point) const {
  ::qdrant::UpsertPoints            req;
  ::qdrant::PointsOperationResponse resp;
  req.set_collection_name(collection);
  req.set_wait(true);
  *req.add_points() = std::move(point);

  Invoke(ctx, "upsert point", [&](::grpc::ClientContext* context) { return points_->Upsert(context, req, &resp); });
}

void QdrantClient::DeletePoint(const CallContext& ctx, const std::string& collection, std::uint64_t id) const {
  ::qdrant::DeletePoints            req;
  ::qdrant::PointsOperationResponse resp;
  req.set_collection_name(collection);
  req.set_wait(true);
  *req.mutable_points()->mutable_points()->add_ids() = NumId(id);

  Invoke(ctx, "delete point", [&](::grpc::ClientContext* context) { return points_->Delete(context, req, &resp); });
}

std::vector<::qdrant::RetrievedPoint> QdrantClient::Get(const CallContext& ctx, const std::string& collection,
                                                        std::uint64_t id, bool with_payload) const {
  ::qdrant::GetPoints   req;
  ::qdrant::GetResponse resp;
  req.set_collection_name(collection);
  *req.add_ids() = NumId(id);
  req.mutable_with_payload()->set_enable(with_payload);
  req.mutable_with_vectors()->set_enable(false);

  Invoke(ctx, "get point", [&](::grpc::ClientContext* context) { return points_->Get(context, req, &resp); });
  return {resp.result().begin(), resp.result().end()};
}

std::vector<::qdrant::ScoredPoint> QdrantClient::Search(const CallContext& ctx, const std::string& collection,
                                                        const std::vector<float>& vector,
                                                        const ::qdrant::Filter& filter, std::uint64_t limit) const {
  ::qdrant::SearchPoints   req;
  ::qdrant::SearchResponse resp;
  req.set_collection_name(collection);
  req.mutable_vector()->Add(vector.begin(), vector.end());
  *req.mutable_filter() = filter;
  req.set_limit(limit);
  req.mutable_with_payload()->set_enable(true);
  req.mutable_with_vectors()->set_enable(false);

  Invoke(ctx, "search points", [&](::grpc::ClientContext* context) { return points_->Search(context, req, &resp); });
  return {resp.result().begin(), resp.result().end()};
}

std::vector<::qdrant::RetrievedPoint> QdrantClient::Scroll(const CallContext& ctx, const std::string& collection,
                                                           const ::qdrant::Filter& filter, std::uint32_t limit) const {
  ::qdrant::ScrollPoints req;
  req.set_collection_name(collection);
  *req.mutable_filter() = filter;
  req.mutable_with_payload()->set_enable(true);
  req.mutable_with_vectors()->set_enable(false);

  // Pages until limit points are collected or the collection is exhausted.
  std::vector<::qdrant::RetrievedPoint> out;
  while (out.size() < limit) {
    req.set_limit(std::min(kScrollPageSize, limit - static_cast<std::uint32_t>(out.size())));

    ::qdrant::ScrollResponse resp;
    Invoke(ctx, "scroll points", [&](::grpc::ClientContext* context) { return points_->Scroll(context, req, &resp); });

    out.insert(out.end(), resp.result().begin(), resp.result().end());
    if (!resp.has_next_page_offset() || resp.result_size() == 0) {
      break;
    }
    *req.mutable_offset() = resp.next_page_offset();
  }
  return out;
}

} // namespace engram::store::qdrant
