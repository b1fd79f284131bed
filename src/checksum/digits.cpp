#include "brdoc/checksum/digits.h"

#include "brdoc/core/ascii.h"

namespace brdoc::checksum {

std::string digits_to_string(const Digits& digits) {
  std::string result;
  result.reserve(digits.size());
  for (const auto d : digits) {
    result.push_back(core::digit_char(d));
  }
  return result;
}

}  // namespace brdoc::checksum
