#include "brdoc/document/error_kind.h"

namespace brdoc::document {

std::string_view to_string(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidInput:
      return "invalid_input";
    case ErrorKind::kInvalidCharacters:
      return "invalid_characters";
    case ErrorKind::kInvalidDocument:
      return "invalid_document";
  }
  return "unknown";  // unreachable - all enumerators covered above
}

std::optional<ErrorKind> parse_error_kind(const std::string_view s) {
  if (s == "invalid_input") {
    return ErrorKind::kInvalidInput;
  }
  if (s == "invalid_characters") {
    return ErrorKind::kInvalidCharacters;
  }
  if (s == "invalid_document") {
    return ErrorKind::kInvalidDocument;
  }
  return std::nullopt;
}

std::string describe(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidInput:
      return "input length does not match any CPF or CNPJ format";
    case ErrorKind::kInvalidCharacters:
      return "input contains characters that are not digits or does not match the expected "
             "punctuation";
    case ErrorKind::kInvalidDocument:
      return "document number did not pass check digit validation";
  }
  return "unknown error";
}

std::ostream& operator<<(std::ostream& os, const ErrorKind kind) { return os << to_string(kind); }

}  // namespace brdoc::document
