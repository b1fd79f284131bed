#pragma once

#include "brdoc/checksum/digits.h"
#include "brdoc/core/result.h"
#include "brdoc/document/error_kind.h"
#include "brdoc/validation/classifier.h"

#include <string_view>

namespace brdoc::validation {

// extract_digits converts characters to digit values according to mode.
//   kStrict        - stops at the first non-digit
//   kMaskStripping - skips every non-digit
[[nodiscard]] checksum::Digits extract_digits(std::string_view input, ExtractionMode mode);

// sanitize turns a classified input into exactly classification.canonical_length digits.
//
// Errors:
//   kInvalidCharacters - extracted digit count differs from the canonical length
//   kInvalidDocument   - every digit is identical (e.g. "11111111111"); this rule is
//                        independent of the checksum and rejects such inputs before it runs
[[nodiscard]] core::Result<checksum::Digits, document::ErrorKind> sanitize(
    std::string_view input, const Classification& classification);

}  // namespace brdoc::validation
