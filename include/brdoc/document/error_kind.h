#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace brdoc::document {

// ErrorKind is the closed set of reasons a document input is rejected.
//
// Detection order is fixed: length, then characters/mask, then uniformity/checksum.
// The first failing check determines the reported kind; later checks never run.
// Callers branch on these values, e.g. to re-prompt on kInvalidCharacters versus
// rejecting outright on kInvalidDocument.
enum class ErrorKind {
  kInvalidInput,       // Length matches no recognized document shape
  kInvalidCharacters,  // Non-digit in a digit position, or punctuation mask mismatch
  kInvalidDocument,    // All digits identical, or check digits do not match
};

// to_string returns the stable identifier ("invalid_input", ...) used in JSON output.
[[nodiscard]] std::string_view to_string(ErrorKind kind);

// parse_error_kind maps an identifier produced by to_string back to its enumerator.
// Case-sensitive; returns nullopt for unrecognised values.
[[nodiscard]] std::optional<ErrorKind> parse_error_kind(std::string_view s);

// describe returns a human-readable sentence suitable for logs and user-facing messages.
[[nodiscard]] std::string describe(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

}  // namespace brdoc::document
