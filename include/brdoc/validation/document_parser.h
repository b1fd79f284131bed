#pragma once

#include "brdoc/core/result.h"
#include "brdoc/document/document.h"
#include "brdoc/document/error_kind.h"
#include "brdoc/validation/parse_options.h"

#include <string_view>

namespace brdoc::validation {

// Entry points of the validation pipeline:
//
//   classify -> sanitize -> family checksum -> canonical document
//
// Each stage short-circuits with its own ErrorKind; no stage reinterprets an earlier
// stage's error. All functions are pure and safe to call concurrently.

// parse validates input as either a CPF or a CNPJ and returns the canonical document.
[[nodiscard]] core::Result<document::Document, document::ErrorKind> parse(
    std::string_view input, const ParseOptions& options = {});

// validate is parse without building the document value.
[[nodiscard]] core::Result<core::Unit, document::ErrorKind> validate(
    std::string_view input, const ParseOptions& options = {});

// parse_cpf and parse_cnpj run the same pipeline restricted to one family's shapes.
// A length that family never has is kInvalidInput (an 11-digit CPF passed to parse_cnpj);
// a 14-character input that is not a formatted CPF is kInvalidCharacters for parse_cpf.
[[nodiscard]] core::Result<document::Cpf, document::ErrorKind> parse_cpf(
    std::string_view input, const ParseOptions& options = {});
[[nodiscard]] core::Result<document::Cnpj, document::ErrorKind> parse_cnpj(
    std::string_view input, const ParseOptions& options = {});

}  // namespace brdoc::validation
