#include "brdoc/validation/document_json.h"

#include "brdoc/validation/document_parser.h"

namespace brdoc::validation {

using document::Document;
using document::ErrorKind;

nlohmann::json document_to_json(const Document& doc) {
  nlohmann::json j;
  j["kind"] = std::string{to_string(family_of(doc))};
  j["value"] = to_text(doc);
  return j;
}

core::Result<Document, ErrorKind> document_from_json(const nlohmann::json& j) {
  using Result = core::Result<Document, ErrorKind>;

  if (!j.is_object() || !j.contains("kind") || !j.contains("value") || !j["kind"].is_string() ||
      !j["value"].is_string()) {
    return Result::err(ErrorKind::kInvalidInput);
  }

  const auto family = document::parse_document_family(j["kind"].get<std::string>());
  if (!family.has_value()) {
    return Result::err(ErrorKind::kInvalidInput);
  }

  // Only the canonical form is stored, so punctuated values are rejected here.
  ParseOptions options;
  options.accepted_format = InputFormat::kSanitizedOnly;

  auto parsed = parse(j["value"].get<std::string>(), options);
  if (!parsed.has_value()) {
    return parsed;
  }
  if (family_of(parsed.value()) != family.value()) {
    return Result::err(ErrorKind::kInvalidInput);
  }
  return parsed;
}

nlohmann::json validation_to_json(const core::Result<Document, ErrorKind>& result) {
  nlohmann::json j;
  if (result.has_value()) {
    j = document_to_json(result.value());
    j["valid"] = true;
  } else {
    j["valid"] = false;
    j["error"] = std::string{to_string(result.error())};
    j["message"] = describe(result.error());
  }
  return j;
}

std::string document_to_json_string(const Document& doc) {
  return document_to_json(doc).dump();  // Compact JSON
}

}  // namespace brdoc::validation
