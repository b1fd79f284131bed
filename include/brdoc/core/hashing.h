#pragma once

#include <cstdint>
#include <string_view>

namespace brdoc::core {

// Deterministic 64-bit hash (FNV-1a). Stable across runs, compilers and platforms,
// unlike std::hash<std::string>.
std::uint64_t stable_hash64(std::string_view input);
std::uint64_t stable_hash64(std::string_view input, std::uint64_t seed);

}  // namespace brdoc::core
