#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <limits>
#include <set>
#include <sstream>

#include "lendcore/common/amount.hpp"

namespace lendcore {
namespace config {

namespace {

using Errors = std::vector<ValidationError>;

// The WAL writer reserves its whole batch buffer on open.
constexpr std::size_t kMaxWalFlushThreshold = std::size_t{64} << 20;

// Integers outside [0, max of T] are reported instead of wrapped.
template <typename T>
T get_uint_or(const toml::table& tbl, std::string_view key, T default_val, const std::string& field, Errors& errors) {
  const auto node = tbl[key];
  if (!node) {
    return default_val;
  }
  const auto val = node.value_exact<std::int64_t>();
  if (!val) {
    errors.push_back({field, "must be an integer"});
    return default_val;
  }
  if (*val < 0 || static_cast<std::uint64_t>(*val) > std::numeric_limits<T>::max()) {
    errors.push_back({field, "must be between 0 and " + std::to_string(std::numeric_limits<T>::max())});
    return default_val;
  }
  return static_cast<T>(*val);
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

// Accepts "1500.5" or a bare non-negative integer, both in whole units.
common::Amount get_amount_or(const toml::table& tbl,
                             std::string_view key,
                             const common::Amount& default_val,
                             const std::string& field,
                             Errors& errors) {
  const auto node = tbl[key];
  if (!node) {
    return default_val;
  }
  if (auto text = node.value<std::string_view>()) {
    if (auto parsed = common::parse_units(*text)) {
      return *parsed;
    }
    errors.push_back({field, "not a decimal amount: " + std::string(*text)});
    return default_val;
  }
  if (auto whole = node.value<std::int64_t>()) {
    if (*whole >= 0) {
      return common::Amount{static_cast<std::uint64_t>(*whole)} * common::kScale;
    }
  }
  errors.push_back({field, "must be a non-negative amount"});
  return default_val;
}

LedgerConfig parse_ledger(const toml::table& root, Errors& errors) {
  LedgerConfig cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.account = get_uint_or(*ledger, "account", cfg.account, "ledger.account", errors);
    cfg.min_collateral_ratio_pct =
        get_uint_or(*ledger, "min_collateral_ratio", cfg.min_collateral_ratio_pct, "ledger.min_collateral_ratio", errors);
    cfg.liquidation_bonus_pct =
        get_uint_or(*ledger, "liquidation_bonus_pct", cfg.liquidation_bonus_pct, "ledger.liquidation_bonus_pct", errors);
    cfg.initial_liquidity = get_amount_or(*ledger, "initial_liquidity", cfg.initial_liquidity, "ledger.initial_liquidity", errors);
  }
  return cfg;
}

OracleConfig parse_oracle(const toml::table& root, Errors& errors) {
  OracleConfig cfg;
  if (auto* oracle = root["oracle"].as_table()) {
    cfg.initial_price = get_amount_or(*oracle, "initial_price", cfg.initial_price, "oracle.initial_price", errors);
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root, Errors& errors) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.wal_path = get_str_or(*persistence, "wal_path", cfg.wal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.wal_flush_threshold = get_uint_or(
        *persistence, "wal_flush_threshold", cfg.wal_flush_threshold, "persistence.wal_flush_threshold", errors);
    cfg.snapshot_interval = get_uint_or(
        *persistence, "snapshot_interval", cfg.snapshot_interval, "persistence.snapshot_interval", errors);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root, Errors& errors) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
    cfg.buffer_size = get_uint_or(*telemetry, "buffer_size", cfg.buffer_size, "telemetry.buffer_size", errors);
  }
  return cfg;
}

std::vector<AccountConfig> parse_accounts(const toml::table& root, Errors& errors) {
  std::vector<AccountConfig> accounts;
  if (auto* arr = root["accounts"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* account_tbl = arr->get(i)->as_table();
      if (!account_tbl) {
        continue;
      }
      const std::string prefix = "accounts[" + std::to_string(i) + "]";
      AccountConfig account;
      account.id = get_uint_or(*account_tbl, "id", common::AccountId{0}, prefix + ".id", errors);
      account.collateral = get_amount_or(*account_tbl, "collateral", account.collateral, prefix + ".collateral", errors);
      account.debt_asset = get_amount_or(*account_tbl, "debt_asset", account.debt_asset, prefix + ".debt_asset", errors);
      account.public_key = get_str_or(*account_tbl, "public_key", "");
      accounts.push_back(std::move(account));
    }
  }
  return accounts;
}

LoadResult parse_config(const toml::table& root) {
  LoadResult result;
  result.config.ledger = parse_ledger(root, result.errors);
  result.config.oracle = parse_oracle(root, result.errors);
  result.config.persistence = parse_persistence(root, result.errors);
  result.config.telemetry = parse_telemetry(root, result.errors);
  result.config.accounts = parse_accounts(root, result.errors);

  auto semantic = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), semantic.begin(), semantic.end());
  result.success = result.errors.empty();
  return result;
}

bool is_hex_key(std::string_view text) {
  if (text.size() != 64) {
    return false;
  }
  for (const char c : text) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    const bool upper = c >= 'A' && c <= 'F';
    if (!digit && !lower && !upper) {
      return false;
    }
  }
  return true;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    LoadResult result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }
  return parse_config(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    LoadResult result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }
  return parse_config(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.ledger.min_collateral_ratio_pct <= 100) {
    errors.push_back({"ledger.min_collateral_ratio", "must be greater than 100"});
  }

  if (config.ledger.liquidation_bonus_pct > 100) {
    errors.push_back({"ledger.liquidation_bonus_pct", "must be at most 100"});
  }

  if (config.oracle.initial_price == 0) {
    errors.push_back({"oracle.initial_price", "must be greater than 0"});
  }

  if (config.persistence.wal_path.empty()) {
    errors.push_back({"persistence.wal_path", "wal_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  if (config.persistence.wal_flush_threshold > kMaxWalFlushThreshold) {
    errors.push_back({"persistence.wal_flush_threshold", "must be at most " + std::to_string(kMaxWalFlushThreshold)});
  }

  if (config.persistence.snapshot_interval == 0) {
    errors.push_back({"persistence.snapshot_interval", "must be greater than 0"});
  }

  std::set<common::AccountId> seen;
  for (std::size_t i = 0; i < config.accounts.size(); ++i) {
    const auto& account = config.accounts[i];
    const std::string prefix = "accounts[" + std::to_string(i) + "]";

    if (account.id == config.ledger.account) {
      errors.push_back({prefix + ".id", "collides with the ledger account"});
    }

    if (!seen.insert(account.id).second) {
      errors.push_back({prefix + ".id", "duplicate account id"});
    }

    if (!account.public_key.empty() && !is_hex_key(account.public_key)) {
      errors.push_back({prefix + ".public_key", "must be 64 hex characters"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# lendcore ledger configuration
# Amounts are in whole units and may carry up to 18 decimals.

[ledger]
account = 0
min_collateral_ratio = 120   # percent
liquidation_bonus_pct = 10   # percent
initial_liquidity = "1000000"

[oracle]
initial_price = "2000"       # debt units per collateral unit

[persistence]
wal_path = "/var/lib/lendcore/events.wal"
snapshot_dir = "/var/lib/lendcore/snapshots"
wal_flush_threshold = 4096
snapshot_interval = 1000     # events between snapshots

[telemetry]
enabled = true
buffer_size = 1024

[[accounts]]
id = 1
collateral = "100"
debt_asset = "0"

[[accounts]]
id = 2
collateral = "0"
debt_asset = "50000"
)";
}

}  // namespace config
}  // namespace lendcore
