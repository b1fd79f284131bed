#include "brdoc/checksum/cnpj_checksum.h"

namespace brdoc::checksum {

namespace {

// Positional weights for the second pass (twelve payload digits plus the first check
// digit). The first pass uses the same table without its leading entry.
constexpr std::array<std::uint32_t, kCnpjPayloadLength + 1> kPositionalWeights = {
    6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

std::uint8_t remainder_to_digit(const std::uint32_t sum) {
  const std::uint32_t r = sum % 11;
  return r < 2 ? std::uint8_t{0} : static_cast<std::uint8_t>(11 - r);
}

}  // namespace

std::array<std::uint8_t, 2> cnpj_check_digits(const CnpjPayload payload) {
  std::uint32_t first_sum = 0;
  for (std::size_t i = 0; i < payload.size(); ++i) {
    first_sum += payload[i] * kPositionalWeights[i + 1];
  }
  const std::uint8_t first = remainder_to_digit(first_sum);

  std::uint32_t second_sum = 0;
  for (std::size_t i = 0; i < payload.size(); ++i) {
    second_sum += payload[i] * kPositionalWeights[i];
  }
  second_sum += first * kPositionalWeights[kCnpjPayloadLength];
  const std::uint8_t second = remainder_to_digit(second_sum);

  return {first, second};
}

core::Result<core::Unit, document::ErrorKind> validate_cnpj(const Digits& digits) {
  using Result = core::Result<core::Unit, document::ErrorKind>;

  if (digits.size() != kCnpjLength) {
    return Result::err(document::ErrorKind::kInvalidInput);
  }

  const auto expected = cnpj_check_digits(CnpjPayload{digits.data(), kCnpjPayloadLength});
  if (digits[12] != expected[0] || digits[13] != expected[1]) {
    return Result::err(document::ErrorKind::kInvalidDocument);
  }
  return Result::ok({});
}

}  // namespace brdoc::checksum
