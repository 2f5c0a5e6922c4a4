#include "call_context.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace engram::store {

bool CallContext::Cancelled() const {
  if (stop.stop_requested()) {
    return true;
  }
  return deadline.has_value() && util::Now() >= *deadline;
}

void CallContext::ThrowIfCancelled(std::string_view operation) const {
  if (Cancelled()) {
    throw util::Cancelled(std::string(operation) + ": cancelled");
  }
}

} // namespace engram::store
