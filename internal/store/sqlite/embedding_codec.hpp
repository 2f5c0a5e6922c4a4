#pragma once

#include <vector>

#include "internal/store/types.hpp"

namespace engram::store::sqlite {

// Packed little-endian IEEE-754 float32, 4 bytes per component.
std::vector<unsigned char> EncodeEmbedding(const Embedding& embedding);

// Trailing bytes that do not form a whole component are ignored.
Embedding DecodeEmbedding(const std::vector<unsigned char>& blob);

} // namespace engram::store::sqlite
