#include "brdoc/core/hashing.h"

namespace brdoc::core {

namespace {

constexpr std::uint64_t kOffset = 14695981039346656037ull;
constexpr std::uint64_t kPrime = 1099511628211ull;

}  // namespace

std::uint64_t stable_hash64(const std::string_view input) { return stable_hash64(input, kOffset); }

std::uint64_t stable_hash64(const std::string_view input, const std::uint64_t seed) {
  std::uint64_t hash = seed;
  for (const char ch : input) {
    // Explicit cast to unsigned char to avoid sign-extension (ES.46: avoid narrowing conversions).
    const auto c = static_cast<unsigned char>(ch);
    hash ^= static_cast<std::uint64_t>(c);
    hash *= kPrime;
  }
  return hash;
}

}  // namespace brdoc::core
