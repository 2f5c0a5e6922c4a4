#include "embedding_codec.hpp"

#include <cstdint>
#include <cstring>

namespace engram::store::sqlite {

std::vector<unsigned char> EncodeEmbedding(const Embedding& embedding) {
  std::vector<unsigned char> blob(embedding.size() * 4);
  for (std::size_t i = 0; i < embedding.size(); ++i) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &embedding[i], sizeof(bits));
    blob[i * 4 + 0] = static_cast<unsigned char>(bits);
    blob[i * 4 + 1] = static_cast<unsigned char>(bits >> 8);
    blob[i * 4 + 2] = static_cast<unsigned char>(bits >> 16);
    blob[i * 4 + 3] = static_cast<unsigned char>(bits >> 24);
  }
  return blob;
}

Embedding DecodeEmbedding(const std::vector<unsigned char>& blob) {
  Embedding embedding(blob.size() / 4);
  for (std::size_t i = 0; i < embedding.size(); ++i) {
    const std::uint32_t bits = static_cast<std::uint32_t>(blob[i * 4 + 0]) |
                               (static_cast<std::uint32_t>(blob[i * 4 + 1]) << 8) |
                               (static_cast<std::uint32_t>(blob[i * 4 + 2]) << 16) |
                               (static_cast<std::uint32_t>(blob[i * 4 + 3]) << 24);
    std::memcpy(&embedding[i], &bits, sizeof(bits));
  }
  return embedding;
}

} // namespace engram::store::sqlite
