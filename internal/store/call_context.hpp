#pragma once

#include <optional>
#include <stop_token>
#include <string_view>

#include "internal/util/time.hpp"

namespace engram::store {

/*
  Per-call cancellation and deadline.

  Local backends check it once on entry and let an already-started scan
  finish. The remote backend forwards the deadline to the RPC and cancels
  in-flight calls when a stop is requested.
*/
struct CallContext {
  std::stop_token                stop;
  std::optional<util::TimePoint> deadline;

  static CallContext Background() {
    return {};
  }

  bool Cancelled() const;

  // Throws util::Cancelled naming the operation.
  void ThrowIfCancelled(std::string_view operation) const;
};

} // namespace engram::store
