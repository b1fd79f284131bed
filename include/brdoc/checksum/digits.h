#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace brdoc::checksum {

// Digits is a sequence of decimal digit values (0..9), not characters.
using Digits = std::vector<std::uint8_t>;

// digits_to_string renders digit values back to their ASCII form.
[[nodiscard]] std::string digits_to_string(const Digits& digits);

}  // namespace brdoc::checksum
