#include "brdoc/validation/sanitizer.h"

#include "brdoc/core/ascii.h"

#include <utility>

namespace brdoc::validation {

checksum::Digits extract_digits(const std::string_view input, const ExtractionMode mode) {
  checksum::Digits digits;
  digits.reserve(input.size());

  for (const char ch : input) {
    const auto value = core::digit_value(ch);
    if (value.has_value()) {
      digits.push_back(value.value());
    } else if (mode == ExtractionMode::kStrict) {
      break;
    }
  }

  return digits;
}

core::Result<checksum::Digits, document::ErrorKind> sanitize(
    const std::string_view input, const Classification& classification) {
  using Result = core::Result<checksum::Digits, document::ErrorKind>;

  auto digits = extract_digits(input, classification.mode);

  if (digits.size() != classification.canonical_length) {
    return Result::err(document::ErrorKind::kInvalidCharacters);
  }
  if (core::all_equal(digits)) {
    return Result::err(document::ErrorKind::kInvalidDocument);
  }

  return Result::ok(std::move(digits));
}

}  // namespace brdoc::validation
