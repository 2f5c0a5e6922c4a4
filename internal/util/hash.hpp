#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace engram::util {

using Sha256Digest = std::array<unsigned char, 32>;

Sha256Digest Sha256(std::string_view data);

// First eight digest bytes read big-endian.
std::uint64_t Sha256Prefix64(std::string_view data);

} // namespace engram::util
