#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace brdoc::document {

// DocumentFamily enumerates the supported Brazilian taxpayer document kinds.
enum class DocumentFamily : std::uint8_t {
  kCpf,   // "cpf"  - Cadastro de Pessoas Fisicas, 11 digits
  kCnpj,  // "cnpj" - Cadastro Nacional da Pessoa Juridica, 14 digits
};

constexpr std::size_t kCpfLength = 11;
constexpr std::size_t kCnpjLength = 14;

[[nodiscard]] constexpr std::size_t canonical_length(const DocumentFamily family) {
  switch (family) {
    case DocumentFamily::kCpf:
      return kCpfLength;
    case DocumentFamily::kCnpj:
      return kCnpjLength;
  }
  return 0;
}

[[nodiscard]] std::string_view to_string(DocumentFamily family);
[[nodiscard]] std::optional<DocumentFamily> parse_document_family(std::string_view s);

namespace detail {
struct DocumentFactory;
}  // namespace detail

// Cpf and Cnpj are classes (not structs) per C++ Core Guidelines C.2: they hold an
// invariant. The wrapped string has exactly the family's canonical length and contains
// only ASCII digits. Constructors are private; the only way to obtain a value is a
// successful validation (validation::parse and friends).
class Cpf {
 public:
  [[nodiscard]] const std::string& digits() const { return digits_; }

  auto operator<=>(const Cpf&) const = default;

 private:
  friend struct detail::DocumentFactory;
  explicit Cpf(std::string digits) : digits_(std::move(digits)) {}

  std::string digits_;
};

class Cnpj {
 public:
  [[nodiscard]] const std::string& digits() const { return digits_; }

  auto operator<=>(const Cnpj&) const = default;

 private:
  friend struct detail::DocumentFactory;
  explicit Cnpj(std::string digits) : digits_(std::move(digits)) {}

  std::string digits_;
};

// Document is the closed sum over document families. Callers dispatch with std::visit
// or family_of(); no new families are anticipated, so exhaustive matching is preferred
// over an open validator interface.
using Document = std::variant<Cpf, Cnpj>;

[[nodiscard]] DocumentFamily family_of(const Document& doc);

// to_text renders the canonical digit-only string. No punctuation is re-inserted.
[[nodiscard]] const std::string& to_text(const Cpf& cpf);
[[nodiscard]] const std::string& to_text(const Cnpj& cnpj);
[[nodiscard]] const std::string& to_text(const Document& doc);

std::ostream& operator<<(std::ostream& os, const Cpf& cpf);
std::ostream& operator<<(std::ostream& os, const Cnpj& cnpj);
std::ostream& operator<<(std::ostream& os, const Document& doc);

namespace detail {

// DocumentFactory is the single construction point for Cpf and Cnpj. It is used by the
// validation pipeline after every check has passed and is not part of the public API.
struct DocumentFactory {
  static Cpf make_cpf(std::string digits) { return Cpf(std::move(digits)); }
  static Cnpj make_cnpj(std::string digits) { return Cnpj(std::move(digits)); }
};

}  // namespace detail

}  // namespace brdoc::document

// std::hash<Document> (a std::variant) is available through these specializations.
namespace std {

template <>
struct hash<brdoc::document::Cpf> {
  std::size_t operator()(const brdoc::document::Cpf& cpf) const noexcept;
};

template <>
struct hash<brdoc::document::Cnpj> {
  std::size_t operator()(const brdoc::document::Cnpj& cnpj) const noexcept;
};

}  // namespace std
