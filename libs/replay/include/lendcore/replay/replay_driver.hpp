#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace lendcore {
namespace replay {

class Driver {
 public:
  using SnapshotHandler = std::function<void(common::SequenceId, std::span<const std::byte>)>;
  using EventHandler = std::function<void(const wal::Record&)>;

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_event_handler(EventHandler handler);

  // Feeds the latest snapshot, then every WAL record newer than it.
  // Returns the last sequence delivered (snapshot or record), 0 if none.
  common::SequenceId execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  EventHandler event_handler_{};
};

struct RecoveryStats {
  common::SequenceId snapshot_sequence{0};
  common::SequenceId last_sequence{0};
  std::uint64_t events_applied{0};
};

// Rebuilds `ledger` from the snapshot directory and WAL.
RecoveryStats recover(ledger::PositionLedger& ledger,
                      const std::filesystem::path& snapshot_directory,
                      const std::filesystem::path& wal_path);

}  // namespace replay
}  // namespace lendcore
