#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace config {

// Amounts are written in whole units ("2000", "0.5") and held scaled by 10^18.
struct LedgerConfig {
  common::AccountId account{0};
  std::uint32_t min_collateral_ratio_pct{common::kMinCollateralRatioPct};
  std::uint32_t liquidation_bonus_pct{common::kLiquidationBonusPct};
  common::Amount initial_liquidity{common::Amount{1'000'000} * common::kScale};
};

struct OracleConfig {
  common::Amount initial_price{common::Amount{2'000} * common::kScale};
};

struct PersistenceConfig {
  std::filesystem::path wal_path{"/var/lib/lendcore/events.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/lendcore/snapshots"};
  std::size_t wal_flush_threshold{4096};
  std::uint64_t snapshot_interval{1000};
};

struct TelemetryConfig {
  bool enabled{true};
  std::size_t buffer_size{1024};
};

// Seed balances for a simulated account and, optionally, its ed25519 key.
struct AccountConfig {
  common::AccountId id{0};
  common::Amount collateral{0};
  common::Amount debt_asset{0};
  std::string public_key{};
};

struct EngineConfig {
  LedgerConfig ledger;
  OracleConfig oracle;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
  std::vector<AccountConfig> accounts;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace lendcore
