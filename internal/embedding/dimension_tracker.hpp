#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

#include "internal/embedding/embedder.hpp"

namespace engram::embedding {

/*
  Wraps an Embedder and reports its output dimension exactly once.

  When the wrapped embedder starts with an unknown dimension, the first
  successful Embed invokes on_discovered with the vector length and then
  records it. The callback completes successfully at most once per
  tracker, even under concurrent Embed calls. If it throws, the exception
  propagates out of Embed, the dimension stays unknown and the next Embed
  invokes it again. An empty vector throws util::StoreError and leaves
  the dimension unknown.
*/
class DimensionTracker final : public Embedder {
 public:
  using DiscoveredCallback = std::function<void(std::size_t)>;

  DimensionTracker(std::shared_ptr<Embedder> inner, DiscoveredCallback on_discovered);

  std::vector<float> Embed(const std::string& text) override;

  std::size_t Dimension() const override;

 private:
  std::shared_ptr<Embedder> inner_;
  DiscoveredCallback        on_discovered_;

  std::mutex               mutex_;
  std::atomic<std::size_t> dim_{0};
};

} // namespace engram::embedding
