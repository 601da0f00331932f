#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

inline constexpr std::size_t kAmountBytes = 32;

// Parses a decimal string in whole units ("12", "0.5", "1500.25") into a value
// scaled by 10^18. Returns nullopt on malformed input, more than 18 fractional
// digits, or overflow.
inline std::optional<Amount> parse_units(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (fraction.size() > kDecimals) {
    return std::nullopt;
  }

  try {
    Amount value{0};
    for (const char c : whole) {
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      value = value * 10 + static_cast<unsigned>(c - '0');
    }
    value *= kScale;

    Amount frac{0};
    for (const char c : fraction) {
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      frac = frac * 10 + static_cast<unsigned>(c - '0');
    }
    for (std::size_t i = fraction.size(); i < kDecimals; ++i) {
      frac *= 10;
    }
    return value + frac;
  } catch (const std::overflow_error&) {
    return std::nullopt;
  }
}

// Inverse of parse_units; trailing fractional zeros are trimmed.
inline std::string format_units(const Amount& value) {
  const Amount whole = value / kScale;
  const Amount frac = value % kScale;
  std::string out = whole.str();
  if (frac == 0) {
    return out;
  }

  std::string digits = frac.str();
  digits.insert(digits.begin(), kDecimals - digits.size(), '0');
  while (!digits.empty() && digits.back() == '0') {
    digits.pop_back();
  }
  out.push_back('.');
  out += digits;
  return out;
}

// Fixed-width big-endian encoding used by the event and snapshot codecs.
inline std::array<std::byte, kAmountBytes> encode_amount(Amount value) noexcept {
  std::array<std::byte, kAmountBytes> out{};
  for (std::size_t i = kAmountBytes; i-- > 0;) {
    out[i] = static_cast<std::byte>((value & 0xff).convert_to<unsigned>());
    value >>= 8;
  }
  return out;
}

inline Amount decode_amount(std::span<const std::byte, kAmountBytes> bytes) {
  Amount value{0};
  for (const auto b : bytes) {
    value <<= 8;
    value |= static_cast<unsigned>(std::to_integer<std::uint8_t>(b));
  }
  return value;
}

}  // namespace common
}  // namespace lendcore
