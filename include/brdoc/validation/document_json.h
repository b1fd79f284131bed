#pragma once

#include "brdoc/core/result.h"
#include "brdoc/document/document.h"
#include "brdoc/document/error_kind.h"

#include <nlohmann/json.hpp>

#include <string>

namespace brdoc::validation {

/// Serialize a document as {"kind": "cpf"|"cnpj", "value": "<canonical digits>"}
[[nodiscard]] nlohmann::json document_to_json(const document::Document& doc);

/// Deserialize a document. The value is re-validated; the payload is never trusted.
/// Missing or non-string fields and an unknown kind are kInvalidInput, as is a kind that
/// disagrees with the family the value validates as.
[[nodiscard]] core::Result<document::Document, document::ErrorKind> document_from_json(const nlohmann::json& j);

/// Serialize a parse outcome:
///   {"valid": true, "kind": "cpf", "value": "..."}
///   {"valid": false, "error": "invalid_characters", "message": "..."}
[[nodiscard]] nlohmann::json validation_to_json(const core::Result<document::Document, document::ErrorKind>& result);

/// Serialize to stable JSON string (no whitespace)
[[nodiscard]] std::string document_to_json_string(const document::Document& doc);

}  // namespace brdoc::validation
