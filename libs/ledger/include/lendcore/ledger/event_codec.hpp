#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "lendcore/ledger/ledger_events.hpp"
#include "lendcore/ledger/position_ledger.hpp"

namespace lendcore {
namespace ledger {

// Event layout (big-endian):
// [kind:1][user:8][liquidator:8][amount:32][debt:32][price:32]
inline constexpr std::size_t kEncodedEventSize = 1 + 8 + 8 + 32 * 3;

// Position table layout: [count:8] then per entry [account:8][collateral:32][debt:32]
inline constexpr std::size_t kEncodedPositionSize = 8 + 32 * 2;

std::vector<std::byte> encode_event(const LedgerEvent& event);
LedgerEvent decode_event(std::span<const std::byte> payload);

std::vector<std::byte> encode_positions(const PositionTable& table);
PositionTable decode_positions(std::span<const std::byte> payload);

}  // namespace ledger
}  // namespace lendcore
