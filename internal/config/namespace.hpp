#pragma once

#include <cstdint>
#include <string>

namespace engram::config {

/*
  Namespace = "provider:model:dim".

  Every stored note lives under exactly one namespace, so switching
  embedder provider, model or dimension starts from an empty store.
*/

inline constexpr std::uint32_t kDefaultVectorDim = 1536;

struct NamespaceParts {
  std::string   provider;
  std::string   model;
  std::uint32_t dim = 0;
};

std::string GenerateNamespace(const std::string& provider, const std::string& model, std::uint32_t dim);

// Throws util::InvalidArgument unless ns has exactly three parts and a
// non-negative integer dim.
NamespaceParts ParseNamespace(const std::string& ns);

// Dim part of ns, or kDefaultVectorDim when it is missing, zero or
// unparsable.
std::uint32_t VectorDimOrDefault(const std::string& ns);

// ':' replaced by '_', for backends whose identifiers reject ':'.
std::string SanitizeNamespace(const std::string& ns);

} // namespace engram::config
