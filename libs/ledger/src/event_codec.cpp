#include "lendcore/ledger/event_codec.hpp"

#include <stdexcept>

#include "lendcore/common/amount.hpp"

namespace lendcore {
namespace ledger {

namespace {

void put_u64(std::vector<std::byte>& out, std::uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::byte>((value >> shift) & 0xff));
  }
}

void put_amount(std::vector<std::byte>& out, const common::Amount& value) {
  const auto bytes = common::encode_amount(value);
  out.insert(out.end(), bytes.begin(), bytes.end());
}

class Cursor {
 public:
  explicit Cursor(std::span<const std::byte> data) : data_(data) {}

  std::uint8_t u8() { return std::to_integer<std::uint8_t>(take(1)[0]); }

  std::uint64_t u64() {
    std::uint64_t value = 0;
    for (const auto b : take(8)) {
      value = (value << 8) | std::to_integer<std::uint8_t>(b);
    }
    return value;
  }

  common::Amount amount() {
    return common::decode_amount(take(common::kAmountBytes).first<common::kAmountBytes>());
  }

  [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }

 private:
  std::span<const std::byte> take(std::size_t count) {
    if (remaining() < count) {
      throw std::runtime_error("truncated ledger record");
    }
    auto out = data_.subspan(offset_, count);
    offset_ += count;
    return out;
  }

  std::span<const std::byte> data_;
  std::size_t offset_{0};
};

}  // namespace

std::vector<std::byte> encode_event(const LedgerEvent& event) {
  std::vector<std::byte> out;
  out.reserve(kEncodedEventSize);
  out.push_back(static_cast<std::byte>(event.kind));
  put_u64(out, event.user);
  put_u64(out, event.liquidator);
  put_amount(out, event.amount);
  put_amount(out, event.debt);
  put_amount(out, event.price);
  return out;
}

LedgerEvent decode_event(std::span<const std::byte> payload) {
  if (payload.size() != kEncodedEventSize) {
    throw std::runtime_error("ledger event has unexpected size");
  }

  Cursor cursor(payload);
  LedgerEvent event;
  const auto kind = cursor.u8();
  if (kind < static_cast<std::uint8_t>(EventKind::kCollateralAdded) ||
      kind > static_cast<std::uint8_t>(EventKind::kLiquidation)) {
    throw std::runtime_error("unknown ledger event kind");
  }
  event.kind = static_cast<EventKind>(kind);
  event.user = cursor.u64();
  event.liquidator = cursor.u64();
  event.amount = cursor.amount();
  event.debt = cursor.amount();
  event.price = cursor.amount();
  return event;
}

std::vector<std::byte> encode_positions(const PositionTable& table) {
  std::vector<std::byte> out;
  out.reserve(8 + table.size() * kEncodedPositionSize);
  put_u64(out, table.size());
  for (const auto& [account, position] : table) {
    put_u64(out, account);
    put_amount(out, position.collateral);
    put_amount(out, position.debt);
  }
  return out;
}

PositionTable decode_positions(std::span<const std::byte> payload) {
  Cursor cursor(payload);
  const auto count = cursor.u64();
  if (count > cursor.remaining() / kEncodedPositionSize || cursor.remaining() != count * kEncodedPositionSize) {
    throw std::runtime_error("position table has unexpected size");
  }

  PositionTable table;
  table.reserve(count);
  for (std::uint64_t i = 0; i < count; ++i) {
    const auto account = cursor.u64();
    Position position;
    position.collateral = cursor.amount();
    position.debt = cursor.amount();
    table.emplace_back(account, std::move(position));
  }
  return table;
}

}  // namespace ledger
}  // namespace lendcore
