#include "brdoc/checksum/cpf_checksum.h"

namespace brdoc::checksum {

namespace {

// Maps the mod-11 result to a single digit: a remainder of 10 becomes 0.
std::uint8_t ten_to_zero(const std::uint32_t remainder) {
  return remainder == 10 ? std::uint8_t{0} : static_cast<std::uint8_t>(remainder);
}

// Weighted sum of the payload with weights starting at first_weight and decreasing by one.
std::uint32_t descending_weighted_sum(const CpfPayload payload, std::uint32_t first_weight) {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < payload.size(); ++i) {
    sum += payload[i] * (first_weight - static_cast<std::uint32_t>(i));
  }
  return sum;
}

}  // namespace

std::array<std::uint8_t, 2> cpf_check_digits(const CpfPayload payload) {
  const std::uint8_t first = ten_to_zero(descending_weighted_sum(payload, 10) * 10 % 11);

  // The first check digit joins the second pass with weight 2.
  const std::uint32_t second_sum = descending_weighted_sum(payload, 11) + first * 2u;
  const std::uint8_t second = ten_to_zero(second_sum * 10 % 11);

  return {first, second};
}

core::Result<core::Unit, document::ErrorKind> validate_cpf(const Digits& digits) {
  using Result = core::Result<core::Unit, document::ErrorKind>;

  if (digits.size() != kCpfLength) {
    return Result::err(document::ErrorKind::kInvalidInput);
  }

  const auto expected = cpf_check_digits(CpfPayload{digits.data(), kCpfPayloadLength});
  if (digits[9] != expected[0] || digits[10] != expected[1]) {
    return Result::err(document::ErrorKind::kInvalidDocument);
  }
  return Result::ok({});
}

}  // namespace brdoc::checksum
