#pragma once

#include "brdoc/core/result.h"
#include "brdoc/document/document.h"
#include "brdoc/document/error_kind.h"
#include "brdoc/validation/parse_options.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace brdoc::validation {

// ExtractionMode tells the sanitizer how to turn a classified input into digits.
enum class ExtractionMode : std::uint8_t {
  kStrict,         // Collect digits up to the first non-digit (sanitized input)
  kMaskStripping,  // Drop every non-digit (input already matched a punctuation mask)
};

// Punctuation masks. '#' stands for one ASCII digit; every other character must match
// literally.
constexpr std::string_view kFormattedCpfMask = "###.###.###-##";
constexpr std::string_view kFormattedCnpjMask = "##.###.###/####-##";

// Classification is the classifier's verdict for one input.
struct Classification {
  document::DocumentFamily family;
  ExtractionMode mode;
  std::size_t canonical_length;

  bool operator==(const Classification&) const = default;
};

// matches_mask reports whether input has the mask's length and every position agrees.
[[nodiscard]] bool matches_mask(std::string_view input, std::string_view mask);

// classify decides the document family and extraction mode from length and mask.
//
// Recognized shapes, tried in order for the input's byte length:
//   11  sanitized CPF
//   14  formatted CPF (when the CPF mask matches), otherwise sanitized CNPJ
//   18  formatted CNPJ
//
// Errors:
//   kInvalidInput      - no enabled shape has this length
//   kInvalidCharacters - every shape of this length is masked and none matched
//
// Characters of unmasked shapes are not inspected here; the sanitizer reports them.
[[nodiscard]] core::Result<Classification, document::ErrorKind> classify(
    std::string_view input, const ParseOptions& options = {});

// classify_as is classify restricted to the shapes of a single family.
[[nodiscard]] core::Result<Classification, document::ErrorKind> classify_as(
    std::string_view input, document::DocumentFamily family, const ParseOptions& options = {});

}  // namespace brdoc::validation
