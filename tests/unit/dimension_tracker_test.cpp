#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/embedding/dimension_tracker.hpp"
#include "internal/util/errors.hpp"

namespace {

using engram::embedding::DimensionTracker;
using engram::embedding::Embedder;
namespace util = engram::util;

class FixedEmbedder final : public Embedder {
 public:
  FixedEmbedder(std::size_t output_dim, std::size_t reported_dim)
      : output_dim_(output_dim), reported_dim_(reported_dim) {}

  std::vector<float> Embed(const std::string&) override {
    calls_.fetch_add(1);
    return std::vector<float>(output_dim_, 0.5f);
  }

  std::size_t Dimension() const override {
    return reported_dim_;
  }

  int Calls() const {
    return calls_.load();
  }

 private:
  std::size_t      output_dim_;
  std::size_t      reported_dim_;
  std::atomic<int> calls_{0};
};

void TestDiscoversOnce() {
  auto             inner = std::make_shared<FixedEmbedder>(384, 0);
  std::vector<int> seen;
  DimensionTracker tracker(inner, [&seen](std::size_t dim) { seen.push_back(static_cast<int>(dim)); });

  assert(tracker.Dimension() == 0);
  assert(tracker.Embed("a").size() == 384);
  assert(tracker.Embed("b").size() == 384);
  assert(tracker.Dimension() == 384);
  assert((seen == std::vector<int>{384}));
  assert(inner->Calls() == 2);
}

void TestKnownDimensionNeverReports() {
  auto inner = std::make_shared<FixedEmbedder>(1536, 1536);
  int  calls = 0;
  DimensionTracker tracker(inner, [&calls](std::size_t) { ++calls; });

  tracker.Embed("a");
  assert(tracker.Dimension() == 1536);
  assert(calls == 0);
}

void TestEmptyEmbeddingIsAnError() {
  auto inner = std::make_shared<FixedEmbedder>(0, 0);
  int  calls = 0;
  DimensionTracker tracker(inner, [&calls](std::size_t) { ++calls; });

  bool threw = false;
  try {
    tracker.Embed("a");
  } catch (const util::StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(tracker.Dimension() == 0);
  assert(calls == 0);
}

void TestFailedCallbackIsRetried() {
  auto             inner    = std::make_shared<FixedEmbedder>(256, 0);
  int              attempts = 0;
  std::vector<int> saved;
  DimensionTracker tracker(inner, [&](std::size_t dim) {
    if (++attempts == 1) {
      throw util::StoreError("save config: disk full");
    }
    saved.push_back(static_cast<int>(dim));
  });

  bool threw = false;
  try {
    tracker.Embed("a");
  } catch (const util::StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(tracker.Dimension() == 0);
  assert(saved.empty());

  assert(tracker.Embed("b").size() == 256);
  assert(tracker.Dimension() == 256);
  assert((saved == std::vector<int>{256}));

  tracker.Embed("c");
  assert(attempts == 2);
}

void TestConcurrentDiscoveryFiresOnce() {
  auto             inner = std::make_shared<FixedEmbedder>(768, 0);
  std::atomic<int> calls{0};
  DimensionTracker tracker(inner, [&calls](std::size_t) { calls.fetch_add(1); });

  std::vector<std::thread> workers;
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&tracker] {
      for (int j = 0; j < 50; ++j) {
        tracker.Embed("text");
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(calls.load() == 1);
  assert(tracker.Dimension() == 768);
}

void TestRequiresEmbedder() {
  bool threw = false;
  try {
    DimensionTracker tracker(nullptr, nullptr);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDiscoversOnce();
  TestKnownDimensionNeverReports();
  TestEmptyEmbeddingIsAnError();
  TestFailedCallbackIsRetried();
  TestConcurrentDiscoveryFiresOnce();
  TestRequiresEmbedder();

  std::cout << "engram_unit_dimension_tracker: pass\n";
  return 0;
}
