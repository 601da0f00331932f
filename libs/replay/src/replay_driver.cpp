#include "lendcore/replay/replay_driver.hpp"

#include <stdexcept>

#include "lendcore/ledger/event_codec.hpp"

namespace lendcore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_store_.prepare(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_event_handler(EventHandler handler) {
  event_handler_ = std::move(handler);
}

common::SequenceId Driver::execute() {
  if (!event_handler_) {
    throw std::runtime_error("event handler not set for replay");
  }

  common::SequenceId last{0};
  if (auto snap = snapshot_store_.latest()) {
    last = snap->sequence;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, snap->payload);
    }
  }

  if (!std::filesystem::exists(wal_path_)) {
    return last;
  }

  wal::Reader reader(wal_path_);
  reader.seek_sequence(last + 1);
  wal::Record record;
  while (reader.next(record)) {
    if (record.header.sequence <= last) {
      continue;
    }
    event_handler_(record);
    last = record.header.sequence;
  }
  return last;
}

RecoveryStats recover(ledger::PositionLedger& ledger,
                      const std::filesystem::path& snapshot_directory,
                      const std::filesystem::path& wal_path) {
  RecoveryStats stats;
  Driver driver;
  driver.configure(snapshot_directory, wal_path);

  driver.set_snapshot_handler([&](common::SequenceId sequence, std::span<const std::byte> payload) {
    ledger.restore(ledger::decode_positions(payload));
    stats.snapshot_sequence = sequence;
  });
  driver.set_event_handler([&](const wal::Record& record) {
    const auto event = ledger::decode_event(record.payload);
    if (record.header.kind != static_cast<std::uint8_t>(event.kind)) {
      throw std::runtime_error("WAL record kind does not match its payload");
    }
    ledger.apply(event);
    ++stats.events_applied;
  });

  stats.last_sequence = driver.execute();
  return stats;
}

}  // namespace replay
}  // namespace lendcore
