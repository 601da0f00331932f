#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lendcore/auth/authenticator.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace lendcore {
namespace api {

enum class CommandKind : std::uint8_t {
  kAddCollateral = 1,
  kWithdrawCollateral = 2,
  kBorrow = 3,
  kRepay = 4,
  kLiquidate = 5,
};

std::string_view to_string(CommandKind kind) noexcept;

// `account` signs the command and is the acting user: the depositor,
// borrower, repayer, or the liquidator. `target` is only read by liquidations.
struct Command {
  CommandKind kind{CommandKind::kAddCollateral};
  common::AccountId account{0};
  common::AccountId target{0};
  common::Amount amount{0};
  std::uint64_t nonce{0};
};

struct SignedCommand {
  Command command{};
  auth::Signature signature{};
};

// Bytes covered by the signature.
std::vector<std::byte> signing_payload(const Command& command);
SignedCommand sign_command(const Command& command, const auth::SecretKey& secret_key);

struct FeedEntry {
  common::SequenceId sequence{0};
  common::TimestampNs timestamp_ns{0};
  ledger::LedgerEvent event{};
};

struct StateRoot {
  common::SequenceId sequence{0};
  auth::Digest root{};
  common::TimestampNs timestamp_ns{0};
};

// Front door of the ledger: authenticates commands, dispatches them, and
// journals, publishes and meters what commits. Once attached, every mutation
// must go through the gateway. The gateway attaches itself as the ledger's
// journal and detaches on destruction, so it may die before the ledger.
//
// A journal write failure aborts the operation (the ledger reverses it) and
// halts the gateway: every later command is refused with kJournalFailed and
// checkpoint() throws. Restart and recover from the WAL to continue.
class LedgerGateway {
 public:
  static constexpr std::size_t kFeedCapacity = 4096;
  static constexpr std::uint64_t kLatencyMetricBase = 200;

  LedgerGateway(ledger::PositionLedger& ledger,
                const auth::Authenticator& authenticator,
                telemetry::TelemetrySink& telemetry,
                wal::Writer* journal = nullptr);
  ~LedgerGateway();
  LedgerGateway(const LedgerGateway&) = delete;
  LedgerGateway& operator=(const LedgerGateway&) = delete;

  ledger::OperationResult submit(const SignedCommand& signed_command);

  [[nodiscard]] bool halted() const;
  // What stopped the journal; empty while running.
  [[nodiscard]] std::string journal_error() const;

  [[nodiscard]] std::vector<FeedEntry> events_since(common::SequenceId since, std::size_t limit = 100) const;
  [[nodiscard]] StateRoot state_root() const;
  [[nodiscard]] common::SequenceId last_sequence() const;

  // Syncs the journal and stores the position table tagged with the last
  // journaled sequence. Returns that sequence.
  common::SequenceId checkpoint(snapshot::Store& store);

  static std::uint64_t outcome_metric(CommandKind kind, ledger::Status status) noexcept;

 private:
  ledger::PositionLedger& ledger_;
  const auth::Authenticator& authenticator_;
  telemetry::TelemetrySink& telemetry_;
  wal::Writer* journal_;

  mutable std::mutex mutex_;
  common::SequenceId last_sequence_{0};
  std::deque<FeedEntry> feed_{};
  std::unordered_map<common::AccountId, std::uint64_t> nonces_{};
  bool halted_{false};
  std::string journal_error_{};

  bool journal_event(const ledger::LedgerEvent& event);
  ledger::OperationResult dispatch(const Command& command);
};

}  // namespace api
}  // namespace lendcore
