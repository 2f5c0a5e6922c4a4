#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace engram::embedding {

/*
  Text -> fixed-length vector.

  Provider clients (OpenAI, Ollama, ...) live outside this library and
  implement this interface.
*/
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> Embed(const std::string& text) = 0;

  // Output length, or 0 while unknown.
  virtual std::size_t Dimension() const = 0;
};

} // namespace engram::embedding
