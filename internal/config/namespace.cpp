#include "namespace.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace engram::config {
namespace {

std::vector<std::string> Split(const std::string& value, char sep) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    auto pos = value.find(sep, start);
    if (pos == std::string::npos) {
      parts.push_back(value.substr(start));
      return parts;
    }
    parts.push_back(value.substr(start, pos - start));
    start = pos + 1;
  }
}

std::optional<std::uint32_t> ParseDim(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint32_t dim = 0;
  auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), dim);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return dim;
}

} // namespace

std::string GenerateNamespace(const std::string& provider, const std::string& model, std::uint32_t dim) {
  return provider + ":" + model + ":" + std::to_string(dim);
}

NamespaceParts ParseNamespace(const std::string& ns) {
  auto parts = Split(ns, ':');
  if (parts.size() != 3) {
    throw util::InvalidArgument("invalid namespace format: \"" + ns + "\"");
  }

  auto dim = ParseDim(parts[2]);
  if (!dim) {
    throw util::InvalidArgument("invalid dimension in namespace: \"" + parts[2] + "\"");
  }

  return NamespaceParts{.provider = parts[0], .model = parts[1], .dim = *dim};
}

std::uint32_t VectorDimOrDefault(const std::string& ns) {
  auto parts = Split(ns, ':');
  if (parts.size() < 3) {
    return kDefaultVectorDim;
  }
  auto dim = ParseDim(parts.back());
  if (!dim || *dim == 0) {
    return kDefaultVectorDim;
  }
  return *dim;
}

std::string SanitizeNamespace(const std::string& ns) {
  std::string out = ns;
  std::replace(out.begin(), out.end(), ':', '_');
  return out;
}

} // namespace engram::config
