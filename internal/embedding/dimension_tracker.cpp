#include "dimension_tracker.hpp"

#include <cstdint>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace engram::embedding {

DimensionTracker::DimensionTracker(std::shared_ptr<Embedder> inner, DiscoveredCallback on_discovered)
    : inner_(std::move(inner)), on_discovered_(std::move(on_discovered)) {
  if (!inner_) {
    throw util::InvalidArgument("dimension tracker requires an embedder");
  }
  dim_ = inner_->Dimension();
}

std::vector<float> DimensionTracker::Embed(const std::string& text) {
  auto vector = inner_->Embed(text);
  if (vector.empty()) {
    throw util::StoreError("embed: empty embedding");
  }

  if (dim_.load() != 0) {
    return vector;
  }

  // Held across the callback so concurrent callers wait for the outcome.
  std::lock_guard lock(mutex_);
  if (dim_.load() != 0) {
    return vector;
  }

  // A throwing callback leaves the dimension unknown; the next Embed retries.
  if (on_discovered_) {
    on_discovered_(vector.size());
  }
  dim_ = vector.size();
  ENGRAM_LOG_INFO("embedding dimension discovered",
                  {observability::IntField("dim", static_cast<std::int64_t>(vector.size()))});
  return vector;
}

std::size_t DimensionTracker::Dimension() const {
  return dim_.load();
}

} // namespace engram::embedding
