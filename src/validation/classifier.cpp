#include "brdoc/validation/classifier.h"

#include "brdoc/core/ascii.h"

#include <array>

namespace brdoc::validation {

namespace {

using document::DocumentFamily;
using document::ErrorKind;
using ClassifyResult = core::Result<Classification, ErrorKind>;

// ────────────────────────────────────────────────────────────────
// Shape Registry
// ────────────────────────────────────────────────────────────────

struct Shape {
  DocumentFamily family;
  std::size_t length;
  std::optional<std::string_view> mask;  // nullopt: sanitized (digits only)
};

// Evaluation order matters for length 14: the formatted CPF shape is tried before the
// sanitized CNPJ shape.
constexpr std::array<Shape, 4> kShapes = {{
    {DocumentFamily::kCpf, document::kCpfLength, std::nullopt},
    {DocumentFamily::kCpf, kFormattedCpfMask.size(), kFormattedCpfMask},
    {DocumentFamily::kCnpj, document::kCnpjLength, std::nullopt},
    {DocumentFamily::kCnpj, kFormattedCnpjMask.size(), kFormattedCnpjMask},
}};

bool format_enabled(const Shape& shape, const InputFormat format) {
  switch (format) {
    case InputFormat::kSanitizedOrFormatted:
      return true;
    case InputFormat::kSanitizedOnly:
      return !shape.mask.has_value();
    case InputFormat::kFormattedOnly:
      return shape.mask.has_value();
  }
  return false;
}

ClassifyResult classify_shapes(const std::string_view input,
                               const std::optional<DocumentFamily> family,
                               const ParseOptions& options) {
  bool length_recognized = false;

  for (const auto& shape : kShapes) {
    if (family.has_value() && shape.family != family.value()) {
      continue;
    }
    if (!format_enabled(shape, options.accepted_format) || shape.length != input.size()) {
      continue;
    }
    length_recognized = true;

    if (!shape.mask.has_value()) {
      return ClassifyResult::ok(Classification{shape.family, ExtractionMode::kStrict,
                                               document::canonical_length(shape.family)});
    }
    if (matches_mask(input, shape.mask.value())) {
      return ClassifyResult::ok(Classification{shape.family, ExtractionMode::kMaskStripping,
                                               document::canonical_length(shape.family)});
    }
  }

  return ClassifyResult::err(length_recognized ? ErrorKind::kInvalidCharacters
                                               : ErrorKind::kInvalidInput);
}

}  // namespace

bool matches_mask(const std::string_view input, const std::string_view mask) {
  if (input.size() != mask.size()) {
    return false;
  }
  for (std::size_t i = 0; i < mask.size(); ++i) {
    const bool ok = mask[i] == '#' ? core::is_ascii_digit(input[i]) : input[i] == mask[i];
    if (!ok) {
      return false;
    }
  }
  return true;
}

ClassifyResult classify(const std::string_view input, const ParseOptions& options) {
  return classify_shapes(input, std::nullopt, options);
}

ClassifyResult classify_as(const std::string_view input, const DocumentFamily family,
                           const ParseOptions& options) {
  return classify_shapes(input, family, options);
}

}  // namespace brdoc::validation
