#pragma once

#include <cstdint>
#include <limits>

#include <boost/multiprecision/cpp_int.hpp>

namespace lendcore {
namespace common {

using AccountId = std::uint64_t;
using SequenceId = std::uint64_t;
using TimestampNs = std::int64_t;

// 256-bit unsigned fixed-point amount. Overflow and underflow throw
// (std::overflow_error / std::range_error) instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;

// Fixed-point scaling shared by collateral, debt and price values (18 decimals).
inline const Amount kScale{1'000'000'000'000'000'000ULL};
inline constexpr unsigned kDecimals = 18;

inline constexpr std::uint32_t kMinCollateralRatioPct = 120;
inline constexpr std::uint32_t kLiquidationBonusPct = 10;
inline constexpr std::uint32_t kPercentDenominator = 100;

inline Amount max_amount() {
  return std::numeric_limits<Amount>::max();
}

}  // namespace common
}  // namespace lendcore
