#pragma once

#include "brdoc/checksum/digits.h"
#include "brdoc/core/result.h"
#include "brdoc/document/error_kind.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace brdoc::checksum {

// CNPJ check digits (modulo 11, cyclic weights 2..9 read right to left).
// For each pass r = sum % 11; the digit is 0 when r < 2, otherwise 11 - r.

constexpr std::size_t kCnpjPayloadLength = 12;
constexpr std::size_t kCnpjLength = kCnpjPayloadLength + 2;

// CnpjPayload is exactly the twelve digits the check digits are computed from.
using CnpjPayload = std::span<const std::uint8_t, kCnpjPayloadLength>;

[[nodiscard]] std::array<std::uint8_t, 2> cnpj_check_digits(CnpjPayload payload);

// validate_cnpj checks a 14-digit sequence against its own trailing check digits.
[[nodiscard]] core::Result<core::Unit, document::ErrorKind> validate_cnpj(const Digits& digits);

}  // namespace brdoc::checksum
