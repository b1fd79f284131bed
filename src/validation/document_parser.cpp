#include "brdoc/validation/document_parser.h"

#include "brdoc/checksum/cnpj_checksum.h"
#include "brdoc/checksum/cpf_checksum.h"
#include "brdoc/validation/classifier.h"
#include "brdoc/validation/sanitizer.h"

#include <utility>

namespace brdoc::validation {

namespace {

using document::Document;
using document::DocumentFamily;
using document::ErrorKind;
using document::detail::DocumentFactory;

// Canonical digits of an input that passed every stage, or the first error.
using ValidateResult = core::Result<checksum::Digits, ErrorKind>;

core::Result<core::Unit, ErrorKind> verify_checksum(const DocumentFamily family,
                                                    const checksum::Digits& digits) {
  switch (family) {
    case DocumentFamily::kCpf:
      return checksum::validate_cpf(digits);
    case DocumentFamily::kCnpj:
      return checksum::validate_cnpj(digits);
  }
  return core::Result<core::Unit, ErrorKind>::err(ErrorKind::kInvalidInput);
}

// run_pipeline executes sanitize and checksum for an already classified input.
ValidateResult run_pipeline(const std::string_view input,
                            const core::Result<Classification, ErrorKind>& classified) {
  if (!classified.has_value()) {
    return ValidateResult::err(classified.error());
  }

  auto sanitized = sanitize(input, classified.value());
  if (!sanitized.has_value()) {
    return sanitized;
  }

  const auto checked = verify_checksum(classified.value().family, sanitized.value());
  if (!checked.has_value()) {
    return ValidateResult::err(checked.error());
  }

  return sanitized;
}

}  // namespace

core::Result<Document, ErrorKind> parse(const std::string_view input,
                                        const ParseOptions& options) {
  using Result = core::Result<Document, ErrorKind>;

  const auto classified = classify(input, options);
  const auto digits = run_pipeline(input, classified);
  if (!digits.has_value()) {
    return Result::err(digits.error());
  }

  auto canonical = checksum::digits_to_string(digits.value());
  switch (classified.value().family) {
    case DocumentFamily::kCpf:
      return Result::ok(DocumentFactory::make_cpf(std::move(canonical)));
    case DocumentFamily::kCnpj:
      return Result::ok(DocumentFactory::make_cnpj(std::move(canonical)));
  }
  return Result::err(ErrorKind::kInvalidInput);
}

core::Result<core::Unit, ErrorKind> validate(const std::string_view input,
                                             const ParseOptions& options) {
  using Result = core::Result<core::Unit, ErrorKind>;

  const auto digits = run_pipeline(input, classify(input, options));
  if (!digits.has_value()) {
    return Result::err(digits.error());
  }
  return Result::ok({});
}

core::Result<document::Cpf, ErrorKind> parse_cpf(const std::string_view input,
                                                 const ParseOptions& options) {
  using Result = core::Result<document::Cpf, ErrorKind>;

  const auto digits = run_pipeline(input, classify_as(input, DocumentFamily::kCpf, options));
  if (!digits.has_value()) {
    return Result::err(digits.error());
  }
  return Result::ok(DocumentFactory::make_cpf(checksum::digits_to_string(digits.value())));
}

core::Result<document::Cnpj, ErrorKind> parse_cnpj(const std::string_view input,
                                                   const ParseOptions& options) {
  using Result = core::Result<document::Cnpj, ErrorKind>;

  const auto digits = run_pipeline(input, classify_as(input, DocumentFamily::kCnpj, options));
  if (!digits.has_value()) {
    return Result::err(digits.error());
  }
  return Result::ok(DocumentFactory::make_cnpj(checksum::digits_to_string(digits.value())));
}

}  // namespace brdoc::validation
