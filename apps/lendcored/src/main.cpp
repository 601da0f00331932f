#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "lendcore/api/ledger_gateway.hpp"
#include "lendcore/assets/collateral_custody.hpp"
#include "lendcore/assets/debt_token.hpp"
#include "lendcore/auth/authenticator.hpp"
#include "lendcore/common/amount.hpp"
#include "lendcore/config/config_loader.hpp"
#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/oracle/price_oracle.hpp"
#include "lendcore/replay/replay_driver.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace {

using namespace lendcore;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or generates defaults\n"
            << "Commands are read from stdin, one per line; type 'help' for the list.\n";
}

void print_commands() {
  std::cout << "  deposit <account> <amount>        add collateral\n"
            << "  withdraw <account> <amount>       withdraw collateral\n"
            << "  borrow <account> <amount>         borrow the debt asset\n"
            << "  approve <account> <amount>        allow the ledger to pull debt asset\n"
            << "  repay <account> <amount>          repay debt\n"
            << "  liquidate <liquidator> <account>  liquidate an unsafe position\n"
            << "  price <amount>                    set the oracle price\n"
            << "  position <account>                show a position\n"
            << "  max-borrow <collateral>           debt allowed for a collateral amount\n"
            << "  events [since]                    show the event feed\n"
            << "  root                              show the state root\n"
            << "  checkpoint                        write a snapshot\n"
            << "  stats                             show operation counters\n"
            << "  quit\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      std::filesystem::path{home ? home : ""} / ".config/lendcore/lendcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }
  return {};
}

std::optional<config::EngineConfig> load_config(const std::filesystem::path& config_path) {
  config::LoadResult result;
  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    result = config::ConfigLoader::load(config_path);
  }

  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return std::nullopt;
  }
  return std::move(result.config);
}

std::optional<common::AccountId> parse_account(const std::string& text) {
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(text, &consumed);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return static_cast<common::AccountId>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

void print_result(api::CommandKind kind, const ledger::OperationResult& result) {
  if (result.ok()) {
    std::cout << api::to_string(kind) << ": ok amount=" << common::format_units(result.amount)
              << " price=" << common::format_units(result.price) << "\n";
  } else {
    std::cout << api::to_string(kind) << ": rejected " << ledger::to_string(result.status)
              << " (" << result.reject_code << ")\n";
  }
}

void print_position(const ledger::PositionLedger& ledger, common::AccountId account) {
  const auto position = ledger.position(account);
  std::cout << "account " << account << ": collateral=" << common::format_units(position.collateral)
            << " debt=" << common::format_units(position.debt);

  const auto value = ledger.collateral_value(account);
  const auto ratio = ledger.position_ratio(account);
  const auto liquidatable = ledger.is_liquidatable(account);
  const auto withdrawable = ledger.max_withdrawable_collateral(account);
  if (!value || !ratio || !liquidatable || !withdrawable) {
    std::cout << " (oracle unavailable)\n";
    return;
  }

  std::cout << " value=" << common::format_units(*value);
  if (position.debt == 0) {
    std::cout << " ratio=inf";
  } else {
    std::cout << " ratio=" << ratio->str() << "%";
  }
  std::cout << " liquidatable=" << (*liquidatable ? "yes" : "no")
            << " max_withdraw=" << common::format_units(*withdrawable) << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  const auto loaded = load_config(find_config_path(argc, argv));
  if (!loaded) {
    return 1;
  }
  const config::EngineConfig& cfg = *loaded;

  std::cout << "Config loaded successfully\n";
  std::cout << "  Ledger account: " << cfg.ledger.account << "\n";
  std::cout << "  Min collateral ratio: " << cfg.ledger.min_collateral_ratio_pct << "%\n";
  std::cout << "  Liquidation bonus: " << cfg.ledger.liquidation_bonus_pct << "%\n";
  std::cout << "  WAL path: " << cfg.persistence.wal_path << "\n";

  try {
    assets::InMemoryDebtToken debt_token;
    assets::InMemoryCollateralCustody custody;
    oracle::ManualPriceOracle price_oracle{cfg.oracle.initial_price};

    debt_token.mint(cfg.ledger.account, cfg.ledger.initial_liquidity);

    auth::Authenticator authenticator;
    std::map<common::AccountId, auth::SecretKey> keyring;
    for (const auto& account : cfg.accounts) {
      custody.fund(account.id, account.collateral);
      debt_token.mint(account.id, account.debt_asset);

      if (!account.public_key.empty()) {
        if (auto key = auth::parse_public_key(account.public_key)) {
          authenticator.register_account(account.id, *key);
        }
        continue;
      }
      const auto pair = auth::generate_keypair();
      authenticator.register_account(account.id, pair.public_key);
      keyring[account.id] = pair.secret_key;
    }
    std::cout << "  Auth: " << cfg.accounts.size() << " configured accounts, "
              << keyring.size() << " signable from this console\n";

    ledger::PositionLedger ledger{cfg.ledger.account,
                                  debt_token,
                                  custody,
                                  price_oracle,
                                  ledger::LedgerParams{
                                      .min_collateral_ratio_pct = cfg.ledger.min_collateral_ratio_pct,
                                      .liquidation_bonus_pct = cfg.ledger.liquidation_bonus_pct,
                                  }};

    std::filesystem::create_directories(cfg.persistence.snapshot_dir);
    if (cfg.persistence.wal_path.has_parent_path()) {
      std::filesystem::create_directories(cfg.persistence.wal_path.parent_path());
    }

    const auto stats = replay::recover(ledger, cfg.persistence.snapshot_dir, cfg.persistence.wal_path);
    std::cout << "  Recovered " << ledger.accounts().size() << " positions (snapshot "
              << stats.snapshot_sequence << ", " << stats.events_applied << " WAL events, last sequence "
              << stats.last_sequence << ")\n";

    // The simulated custody starts empty; move recovered collateral back into it.
    const auto recovered_collateral = ledger.total_collateral();
    if (recovered_collateral > 0) {
      custody.fund(cfg.ledger.account, recovered_collateral);
      if (!custody.receive(cfg.ledger.account, recovered_collateral)) {
        std::cerr << "Failed to re-seed custody with recovered collateral\n";
        return 1;
      }
    }

    wal::Writer journal{cfg.persistence.wal_path, cfg.persistence.wal_flush_threshold};
    snapshot::Store snapshots{cfg.persistence.snapshot_dir};
    telemetry::TelemetrySink telemetry{cfg.telemetry.buffer_size, cfg.telemetry.enabled};
    api::LedgerGateway gateway{ledger, authenticator, telemetry, &journal};

    std::cout << "lendcored ready\n";

    std::map<common::AccountId, std::uint64_t> nonces;
    common::SequenceId last_checkpoint = stats.last_sequence;

    auto submit = [&](api::CommandKind kind, common::AccountId account, common::AccountId target,
                      const common::Amount& amount) {
      auto key = keyring.find(account);
      if (key == keyring.end()) {
        std::cout << "no signing key for account " << account << "\n";
        return;
      }
      const api::Command command{
          .kind = kind, .account = account, .target = target, .amount = amount, .nonce = ++nonces[account]};
      print_result(kind, gateway.submit(api::sign_command(command, key->second)));
      if (gateway.halted()) {
        return;
      }

      if (gateway.last_sequence() - last_checkpoint >= cfg.persistence.snapshot_interval) {
        last_checkpoint = gateway.checkpoint(snapshots);
      }
    };

    const std::map<std::string, api::CommandKind> amount_commands = {
        {"deposit", api::CommandKind::kAddCollateral},
        {"withdraw", api::CommandKind::kWithdrawCollateral},
        {"borrow", api::CommandKind::kBorrow},
        {"repay", api::CommandKind::kRepay},
    };

    std::string line;
    while (!gateway.halted() && std::getline(std::cin, line)) {
      std::istringstream in(line);
      std::vector<std::string> args;
      for (std::string word; in >> word;) {
        args.push_back(word);
      }
      if (args.empty() || args[0].front() == '#') {
        continue;
      }
      const std::string& verb = args[0];

      if (verb == "quit" || verb == "exit") {
        break;
      }
      if (verb == "help") {
        print_commands();
        continue;
      }

      if (auto it = amount_commands.find(verb); it != amount_commands.end() && args.size() == 3) {
        const auto account = parse_account(args[1]);
        const auto amount = common::parse_units(args[2]);
        if (!account || !amount) {
          std::cout << "usage: " << verb << " <account> <amount>\n";
          continue;
        }
        submit(it->second, *account, 0, *amount);
      } else if (verb == "liquidate" && args.size() == 3) {
        const auto liquidator = parse_account(args[1]);
        const auto account = parse_account(args[2]);
        if (!liquidator || !account) {
          std::cout << "usage: liquidate <liquidator> <account>\n";
          continue;
        }
        submit(api::CommandKind::kLiquidate, *liquidator, *account, 0);
      } else if (verb == "approve" && args.size() == 3) {
        const auto account = parse_account(args[1]);
        const auto amount = common::parse_units(args[2]);
        if (!account || !amount) {
          std::cout << "usage: approve <account> <amount>\n";
          continue;
        }
        debt_token.approve(*account, cfg.ledger.account, *amount);
        std::cout << "approved " << common::format_units(*amount) << " for account " << *account << "\n";
      } else if (verb == "price" && args.size() == 2) {
        const auto price = common::parse_units(args[1]);
        if (!price) {
          std::cout << "usage: price <amount>\n";
          continue;
        }
        price_oracle.set_price(*price);
        std::cout << "price set to " << common::format_units(*price) << "\n";
      } else if (verb == "position" && args.size() == 2) {
        const auto account = parse_account(args[1]);
        if (!account) {
          std::cout << "usage: position <account>\n";
          continue;
        }
        print_position(ledger, *account);
      } else if (verb == "max-borrow" && args.size() == 2) {
        const auto collateral = common::parse_units(args[1]);
        const auto limit = collateral ? ledger.max_borrow_amount(*collateral) : std::nullopt;
        if (!limit) {
          std::cout << "max-borrow unavailable\n";
          continue;
        }
        std::cout << "max borrow: " << common::format_units(*limit) << "\n";
      } else if (verb == "events") {
        const auto since = args.size() > 1 ? parse_account(args[1]).value_or(0) : 0;
        for (const auto& entry : gateway.events_since(since)) {
          std::cout << "#" << entry.sequence << " " << ledger::to_string(entry.event.kind)
                    << " user=" << entry.event.user << " amount=" << common::format_units(entry.event.amount)
                    << " price=" << common::format_units(entry.event.price);
          if (entry.event.kind == ledger::EventKind::kLiquidation) {
            std::cout << " liquidator=" << entry.event.liquidator
                      << " debt=" << common::format_units(entry.event.debt);
          }
          std::cout << "\n";
        }
      } else if (verb == "root") {
        const auto root = gateway.state_root();
        std::cout << "state root @" << root.sequence << ": " << auth::to_hex(root.root) << "\n";
      } else if (verb == "checkpoint") {
        last_checkpoint = gateway.checkpoint(snapshots);
        std::cout << "snapshot written at sequence " << last_checkpoint << "\n";
      } else if (verb == "stats") {
        std::cout << "positions=" << ledger.accounts().size()
                  << " total_collateral=" << common::format_units(ledger.total_collateral())
                  << " total_debt=" << common::format_units(ledger.total_debt())
                  << " liquidity=" << common::format_units(debt_token.balance_of(cfg.ledger.account)) << "\n";
        for (const auto& summary : telemetry.drain_latency()) {
          std::cout << "  latency[" << summary.id << "] count=" << summary.count << " mean_ns=" << summary.mean_ns
                    << " p99_ns=" << summary.p99_ns << "\n";
        }
      } else {
        std::cout << "unknown command: " << line << " (try 'help')\n";
      }
    }

    if (gateway.halted()) {
      std::cerr << "Journal failed, stopping without a snapshot: " << gateway.journal_error() << "\n";
      return 1;
    }
    gateway.checkpoint(snapshots);
    std::cout << "lendcored stopped at sequence " << gateway.last_sequence() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
