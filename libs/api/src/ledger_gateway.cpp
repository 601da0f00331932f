#include "lendcore/api/ledger_gateway.hpp"

#include <stdexcept>

#include "lendcore/common/amount.hpp"
#include "lendcore/common/time_utils.hpp"
#include "lendcore/ledger/event_codec.hpp"

namespace lendcore {
namespace api {

namespace {

constexpr std::string_view kCommandDomain = "lendcore/command/v1";

void put_u64(std::vector<std::byte>& out, std::uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::byte>((value >> shift) & 0xff));
  }
}

ledger::OperationResult refused(ledger::Status status) {
  ledger::OperationResult result;
  result.status = status;
  result.reject_code = ledger::reject_code(status);
  return result;
}

}  // namespace

std::string_view to_string(CommandKind kind) noexcept {
  switch (kind) {
    case CommandKind::kAddCollateral:
      return "add-collateral";
    case CommandKind::kWithdrawCollateral:
      return "withdraw-collateral";
    case CommandKind::kBorrow:
      return "borrow";
    case CommandKind::kRepay:
      return "repay";
    case CommandKind::kLiquidate:
      return "liquidate";
  }
  return "unknown";
}

std::vector<std::byte> signing_payload(const Command& command) {
  std::vector<std::byte> out;
  out.reserve(kCommandDomain.size() + 1 + 8 * 3 + common::kAmountBytes);
  for (const char c : kCommandDomain) {
    out.push_back(static_cast<std::byte>(c));
  }
  out.push_back(static_cast<std::byte>(command.kind));
  put_u64(out, command.account);
  put_u64(out, command.target);
  const auto amount = common::encode_amount(command.amount);
  out.insert(out.end(), amount.begin(), amount.end());
  put_u64(out, command.nonce);
  return out;
}

SignedCommand sign_command(const Command& command, const auth::SecretKey& secret_key) {
  return SignedCommand{.command = command, .signature = auth::sign(secret_key, signing_payload(command))};
}

LedgerGateway::LedgerGateway(ledger::PositionLedger& ledger,
                             const auth::Authenticator& authenticator,
                             telemetry::TelemetrySink& telemetry,
                             wal::Writer* journal)
    : ledger_(ledger), authenticator_(authenticator), telemetry_(telemetry), journal_(journal) {
  if (journal_) {
    last_sequence_ = journal_->next_sequence() - 1;
  }
  ledger_.set_journal([this](const ledger::LedgerEvent& event) { return journal_event(event); });
}

LedgerGateway::~LedgerGateway() {
  ledger_.set_journal(nullptr);
}

ledger::OperationResult LedgerGateway::submit(const SignedCommand& signed_command) {
  const auto started = common::now_steady();
  const Command& command = signed_command.command;

  std::lock_guard<std::mutex> lock(mutex_);

  if (halted_) {
    telemetry_.increment(outcome_metric(command.kind, ledger::Status::kJournalFailed));
    return refused(ledger::Status::kJournalFailed);
  }
  if (!authenticator_.verify(command.account, signing_payload(command), signed_command.signature)) {
    telemetry_.increment(outcome_metric(command.kind, ledger::Status::kUnauthorized));
    return refused(ledger::Status::kUnauthorized);
  }
  auto [nonce_it, first_seen] = nonces_.try_emplace(command.account, command.nonce);
  if (!first_seen) {
    if (command.nonce <= nonce_it->second) {
      telemetry_.increment(outcome_metric(command.kind, ledger::Status::kUnauthorized));
      return refused(ledger::Status::kUnauthorized);
    }
    nonce_it->second = command.nonce;
  }

  const auto result = dispatch(command);

  telemetry_.increment(outcome_metric(command.kind, result.status));
  telemetry_.record_latency(kLatencyMetricBase + static_cast<std::uint64_t>(command.kind),
                            common::now_steady() - started);
  return result;
}

ledger::OperationResult LedgerGateway::dispatch(const Command& command) {
  switch (command.kind) {
    case CommandKind::kAddCollateral:
      return ledger_.add_collateral(command.account, command.amount);
    case CommandKind::kWithdrawCollateral:
      return ledger_.withdraw_collateral(command.account, command.amount);
    case CommandKind::kBorrow:
      return ledger_.borrow(command.account, command.amount);
    case CommandKind::kRepay:
      return ledger_.repay(command.account, command.amount);
    case CommandKind::kLiquidate:
      return ledger_.liquidate(command.account, command.target);
  }
  throw std::invalid_argument("unknown command kind");
}

// Runs inside a ledger call made by submit(), before the ledger commits, so
// mutex_ is held.
bool LedgerGateway::journal_event(const ledger::LedgerEvent& event) {
  if (halted_) {
    return false;
  }
  common::SequenceId sequence = last_sequence_ + 1;
  if (journal_) {
    try {
      sequence = journal_->append(static_cast<std::uint8_t>(event.kind), ledger::encode_event(event));
    } catch (const std::exception& e) {
      halted_ = true;
      journal_error_ = e.what();
      return false;
    }
  }
  last_sequence_ = sequence;

  if (feed_.size() == kFeedCapacity) {
    feed_.pop_front();
  }
  feed_.push_back(FeedEntry{.sequence = sequence, .timestamp_ns = common::now_wall_ns(), .event = event});
  return true;
}

bool LedgerGateway::halted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return halted_;
}

std::string LedgerGateway::journal_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return journal_error_;
}

std::vector<FeedEntry> LedgerGateway::events_since(common::SequenceId since, std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<FeedEntry> result;
  for (const auto& entry : feed_) {
    if (entry.sequence < since) {
      continue;
    }
    result.push_back(entry);
    if (result.size() >= limit) {
      break;
    }
  }
  return result;
}

StateRoot LedgerGateway::state_root() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto encoded = ledger::encode_positions(ledger_.export_positions());
  return StateRoot{.sequence = last_sequence_, .root = auth::digest(encoded), .timestamp_ns = common::now_wall_ns()};
}

common::SequenceId LedgerGateway::last_sequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sequence_;
}

common::SequenceId LedgerGateway::checkpoint(snapshot::Store& store) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (halted_) {
    throw std::runtime_error("journal halted, refusing to snapshot: " + journal_error_);
  }
  if (journal_) {
    journal_->sync();
  }
  store.persist(last_sequence_, ledger::encode_positions(ledger_.export_positions()));
  return last_sequence_;
}

std::uint64_t LedgerGateway::outcome_metric(CommandKind kind, ledger::Status status) noexcept {
  return static_cast<std::uint64_t>(kind) * 16 + static_cast<std::uint64_t>(status);
}

}  // namespace api
}  // namespace lendcore
