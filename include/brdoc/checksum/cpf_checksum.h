#pragma once

#include "brdoc/checksum/digits.h"
#include "brdoc/core/result.h"
#include "brdoc/document/error_kind.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace brdoc::checksum {

// CPF check digits (modulo 11, descending weights).
//
//   first  = (sum(d[i] * (10 - i)) for i in 0..8) * 10 % 11, with 10 mapped to 0
//   second = (sum(d[i] * (11 - i)) for i in 0..8 + first * 2) * 10 % 11, with 10 mapped to 0

constexpr std::size_t kCpfPayloadLength = 9;
constexpr std::size_t kCpfLength = kCpfPayloadLength + 2;

// CpfPayload is exactly the nine digits the check digits are computed from.
// Bind it from a std::array<std::uint8_t, 9>, or explicitly from a pointer and count.
using CpfPayload = std::span<const std::uint8_t, kCpfPayloadLength>;

[[nodiscard]] std::array<std::uint8_t, 2> cpf_check_digits(CpfPayload payload);

// validate_cpf checks an 11-digit sequence against its own trailing check digits.
// Returns kInvalidDocument on mismatch. Length and uniformity are the sanitizer's job;
// a sequence of the wrong length is reported as kInvalidInput.
[[nodiscard]] core::Result<core::Unit, document::ErrorKind> validate_cpf(const Digits& digits);

}  // namespace brdoc::checksum
