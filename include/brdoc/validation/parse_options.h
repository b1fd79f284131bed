#pragma once

// InputFormat - which textual shapes the classifier accepts.
//
// Enum.2: related named constants as an enumeration, so every switch over it is
// checked for exhaustiveness by the compiler.
//
// String values: "any", "sanitized", "formatted"

#include <cstdint>
#include <optional>
#include <string_view>

namespace brdoc::validation {

enum class InputFormat : std::uint8_t {
  kSanitizedOrFormatted,  // "any"       - bare digits or the exact punctuation mask (default)
  kSanitizedOnly,         // "sanitized" - bare digits only; punctuation is never accepted
  kFormattedOnly,         // "formatted" - punctuated input only
};

// ParseOptions holds caller configuration for a parse/validate call.
// Every field has an explicit default; a default-constructed ParseOptions accepts both
// sanitized and formatted CPF/CNPJ input.
struct ParseOptions {
  InputFormat accepted_format{  // NOLINT(readability-identifier-naming)
                              InputFormat::kSanitizedOrFormatted};
};

// parse_input_format parses a configuration value into an InputFormat.
// Case-sensitive; returns nullopt for unrecognised values (including empty string).
[[nodiscard]] inline std::optional<InputFormat> parse_input_format(std::string_view s) {
  if (s == "any") {
    return InputFormat::kSanitizedOrFormatted;
  }
  if (s == "sanitized") {
    return InputFormat::kSanitizedOnly;
  }
  if (s == "formatted") {
    return InputFormat::kFormattedOnly;
  }
  return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(InputFormat f) {
  switch (f) {
    case InputFormat::kSanitizedOrFormatted:
      return "any";
    case InputFormat::kSanitizedOnly:
      return "sanitized";
    case InputFormat::kFormattedOnly:
      return "formatted";
  }
  return "unknown";  // unreachable - all enumerators covered above
}

}  // namespace brdoc::validation
