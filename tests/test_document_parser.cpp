#include "brdoc/validation/document_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

using namespace brdoc::validation;
using brdoc::document::DocumentFamily;
using brdoc::document::ErrorKind;

namespace {

struct Case {
  std::string input;
  std::optional<ErrorKind> expected;  // nullopt: valid
  const char* description;
};

void check_validate(const Case& c, const ParseOptions& options = {}) {
  INFO(c.description << ": \"" << c.input << "\"");
  const auto result = validate(c.input, options);
  if (c.expected.has_value()) {
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == c.expected.value());
  } else {
    CHECK(result.has_value());
  }
}

}  // namespace

TEST_CASE("validate: sanitized and formatted documents", "[validation][parser]") {
  const Case cases[] = {
      {"96865090039", std::nullopt, "sanitized CPF"},
      {"288.111.210-27", std::nullopt, "formatted CPF"},
      {"03165685000114", std::nullopt, "sanitized CNPJ"},
      {"89.654.922/0001-26", std::nullopt, "formatted CNPJ"},
      {"111.111.111-11", ErrorKind::kInvalidDocument, "formatted all-equal CPF"},
      {"11111111111", ErrorKind::kInvalidDocument, "sanitized all-equal CPF"},
      {"00000000000000", ErrorKind::kInvalidDocument, "sanitized all-equal CNPJ"},
      {"79888245131", ErrorKind::kInvalidDocument, "CPF with wrong check digits"},
      {"798.882.451-31", ErrorKind::kInvalidDocument, "formatted CPF with wrong check digits"},
      {"73361907000130", ErrorKind::kInvalidDocument, "CNPJ with wrong check digits"},
      {"73.361.907/0001-30", ErrorKind::kInvalidDocument,
       "formatted CNPJ with wrong check digits"},
      {"272.676.S60-21", ErrorKind::kInvalidCharacters, "formatted CPF with a letter"},
      {"272676S6021", ErrorKind::kInvalidCharacters, "sanitized CPF with a letter"},
      {"272-676.560-21", ErrorKind::kInvalidCharacters, "CPF with wrong punctuation"},
      {"66.114.93S/0001-07", ErrorKind::kInvalidCharacters, "formatted CNPJ with a letter"},
      {"896S4922000126", ErrorKind::kInvalidCharacters, "sanitized CNPJ with a letter"},
      {"66.114-935/0001-07", ErrorKind::kInvalidCharacters, "CNPJ with wrong punctuation"},
      {"66.114-935/001-07", ErrorKind::kInvalidInput, "17 characters"},
      {"288.11.210-27", ErrorKind::kInvalidInput, "13 characters"},
      {"66.114-935/00001-07", ErrorKind::kInvalidInput, "19 characters"},
      {"288.1112.210-27", ErrorKind::kInvalidInput, "15 characters"},
      {"6611493500107", ErrorKind::kInvalidInput, "13 digits"},
      {"2881121027", ErrorKind::kInvalidInput, "10 digits"},
      {"661149350000107", ErrorKind::kInvalidInput, "15 digits"},
      {"288111221027", ErrorKind::kInvalidInput, "12 digits"},
      {"", ErrorKind::kInvalidInput, "empty input"},
  };

  for (const auto& c : cases) {
    check_validate(c);
  }
}

TEST_CASE("validate: errors are reported in length, characters, checksum order",
          "[validation][parser]") {
  // Wrong length wins even when characters are also invalid.
  CHECK(validate("2881S1221027").error() == ErrorKind::kInvalidInput);
  // Invalid characters win over an all-equal or failing checksum.
  CHECK(validate("1111111111S").error() == ErrorKind::kInvalidCharacters);
  CHECK(validate("7988824513S").error() == ErrorKind::kInvalidCharacters);
}

TEST_CASE("validate: surrounding whitespace is not trimmed", "[validation][parser]") {
  CHECK(validate(" 96865090039").error() == ErrorKind::kInvalidInput);
  CHECK(validate(" 9686509003").error() == ErrorKind::kInvalidCharacters);
  CHECK(validate("9686509003 ").error() == ErrorKind::kInvalidCharacters);
}

TEST_CASE("parse: returns the canonical document", "[validation][parser]") {
  const auto cpf = parse("288.111.210-27");
  REQUIRE(cpf.has_value());
  CHECK(family_of(cpf.value()) == DocumentFamily::kCpf);
  CHECK(to_text(cpf.value()) == "28811121027");

  const auto cnpj = parse("03165685000114");
  REQUIRE(cnpj.has_value());
  CHECK(family_of(cnpj.value()) == DocumentFamily::kCnpj);
  CHECK(to_text(cnpj.value()) == "03165685000114");
}

TEST_CASE("parse and validate agree", "[validation][parser]") {
  for (const char* input : {"96865090039", "89.654.922/0001-26", "79888245131", "272676S6021",
                            "2881121027", "66.114.93S/0001-07"}) {
    const auto parsed = parse(input);
    const auto validated = validate(input);
    REQUIRE(parsed.has_value() == validated.has_value());
    if (!parsed.has_value()) {
      CHECK(parsed.error() == validated.error());
    }
  }
}

TEST_CASE("parse: kSanitizedOnly rejects punctuation", "[validation][parser]") {
  const ParseOptions options{InputFormat::kSanitizedOnly};

  CHECK(parse("96865090039", options).has_value());
  CHECK(parse("03165685000114", options).has_value());
  CHECK(parse("288.111.210-27", options).error() == ErrorKind::kInvalidCharacters);
  CHECK(parse("89.654.922/0001-26", options).error() == ErrorKind::kInvalidInput);
}

TEST_CASE("parse: kFormattedOnly rejects bare digits", "[validation][parser]") {
  const ParseOptions options{InputFormat::kFormattedOnly};

  CHECK(parse("288.111.210-27", options).has_value());
  CHECK(parse("89.654.922/0001-26", options).has_value());
  CHECK(parse("96865090039", options).error() == ErrorKind::kInvalidInput);
  CHECK(parse("03165685000114", options).error() == ErrorKind::kInvalidCharacters);
}

// ── family-restricted entry points ──────────────────────────────────────────

TEST_CASE("parse_cpf: accepts only CPF shapes", "[validation][parser][cpf]") {
  const auto sanitized = parse_cpf("96865090039");
  REQUIRE(sanitized.has_value());
  CHECK(to_text(sanitized.value()) == "96865090039");

  const auto formatted = parse_cpf("288.111.210-27");
  REQUIRE(formatted.has_value());
  CHECK(to_text(formatted.value()) == "28811121027");

  CHECK(parse_cpf("03165685000114").error() == ErrorKind::kInvalidCharacters);
  CHECK(parse_cpf("03165685000114", ParseOptions{InputFormat::kSanitizedOnly}).error() ==
        ErrorKind::kInvalidInput);
  CHECK(parse_cpf("89.654.922/0001-26").error() == ErrorKind::kInvalidInput);
  CHECK(parse_cpf("79888245131").error() == ErrorKind::kInvalidDocument);
}

TEST_CASE("parse_cnpj: accepts only CNPJ shapes", "[validation][parser][cnpj]") {
  const auto sanitized = parse_cnpj("03165685000114");
  REQUIRE(sanitized.has_value());
  CHECK(to_text(sanitized.value()) == "03165685000114");

  const auto formatted = parse_cnpj("89.654.922/0001-26");
  REQUIRE(formatted.has_value());
  CHECK(to_text(formatted.value()) == "89654922000126");

  CHECK(parse_cnpj("96865090039").error() == ErrorKind::kInvalidInput);
  CHECK(parse_cnpj("288.111.210-27").error() == ErrorKind::kInvalidCharacters);
  CHECK(parse_cnpj("73361907000130").error() == ErrorKind::kInvalidDocument);
}

TEST_CASE("parse_cpf and parse agree on CPF input", "[validation][parser][cpf]") {
  const auto generic = parse("288.111.210-27");
  const auto specific = parse_cpf("288.111.210-27");
  REQUIRE(generic.has_value());
  REQUIRE(specific.has_value());
  CHECK(generic.value() == brdoc::document::Document{specific.value()});
}
