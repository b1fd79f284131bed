#include "brdoc/document/document.h"

#include "brdoc/core/hashing.h"

namespace brdoc::document {

namespace {

// Distinct seeds keep a CPF and a CNPJ from colliding by construction when both are
// stored in the same hashed container.
constexpr std::uint64_t kCpfHashSeed = 0x6370660000000000ull;   // "cpf"
constexpr std::uint64_t kCnpjHashSeed = 0x636e706a00000000ull;  // "cnpj"

}  // namespace

std::string_view to_string(const DocumentFamily family) {
  switch (family) {
    case DocumentFamily::kCpf:
      return "cpf";
    case DocumentFamily::kCnpj:
      return "cnpj";
  }
  return "unknown";
}

std::optional<DocumentFamily> parse_document_family(const std::string_view s) {
  if (s == "cpf") {
    return DocumentFamily::kCpf;
  }
  if (s == "cnpj") {
    return DocumentFamily::kCnpj;
  }
  return std::nullopt;
}

DocumentFamily family_of(const Document& doc) {
  return std::holds_alternative<Cpf>(doc) ? DocumentFamily::kCpf : DocumentFamily::kCnpj;
}

const std::string& to_text(const Cpf& cpf) { return cpf.digits(); }

const std::string& to_text(const Cnpj& cnpj) { return cnpj.digits(); }

const std::string& to_text(const Document& doc) {
  return std::visit([](const auto& d) -> const std::string& { return d.digits(); }, doc);
}

std::ostream& operator<<(std::ostream& os, const Cpf& cpf) { return os << to_text(cpf); }

std::ostream& operator<<(std::ostream& os, const Cnpj& cnpj) { return os << to_text(cnpj); }

std::ostream& operator<<(std::ostream& os, const Document& doc) { return os << to_text(doc); }

}  // namespace brdoc::document

namespace std {

size_t hash<brdoc::document::Cpf>::operator()(
    const brdoc::document::Cpf& cpf) const noexcept {
  return static_cast<std::size_t>(
      brdoc::core::stable_hash64(cpf.digits(), brdoc::document::kCpfHashSeed));
}

size_t hash<brdoc::document::Cnpj>::operator()(
    const brdoc::document::Cnpj& cnpj) const noexcept {
  return static_cast<std::size_t>(
      brdoc::core::stable_hash64(cnpj.digits(), brdoc::document::kCnpjHashSeed));
}

}  // namespace std
