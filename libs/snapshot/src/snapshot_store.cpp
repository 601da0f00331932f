#include "lendcore/snapshot/snapshot_store.hpp"

#include <fstream>
#include <stdexcept>

#include "lendcore/wal/wal_writer.hpp"

namespace lendcore {
namespace snapshot {

namespace {
constexpr std::uint32_t kMagic = 0x4c43534e;  // 'LCSN'

struct SnapshotHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{1};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  std::uint64_t payload_size{0};
  std::uint32_t checksum{0};
  std::uint32_t reserved2{0};
};

}  // namespace

Store::Store() = default;

Store::Store(std::filesystem::path directory) {
  prepare(directory);
}

void Store::prepare(const std::filesystem::path& directory) {
  std::filesystem::create_directories(directory);
  directory_ = directory;
  file_path_ = directory_ / "positions.snap";
}

void Store::persist(common::SequenceId sequence_id, std::span<const std::byte> payload) {
  if (directory_.empty()) {
    throw std::runtime_error("snapshot store directory not set");
  }

  const auto tmp_path = std::filesystem::path(file_path_).concat(".tmp");
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open snapshot file for write: " + tmp_path.string());
    }

    SnapshotHeader header;
    header.sequence = sequence_id;
    header.payload_size = payload.size();
    header.checksum = wal::checksum32(payload);

    out.write(reinterpret_cast<const char*>(&header), sizeof(header));
    if (!payload.empty()) {
      out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write snapshot: " + tmp_path.string());
    }
  }
  std::filesystem::rename(tmp_path, file_path_);
}

std::optional<SnapshotRecord> Store::latest() const {
  if (file_path_.empty() || !std::filesystem::exists(file_path_)) {
    return std::nullopt;
  }

  std::ifstream in(file_path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open snapshot file for read: " + file_path_.string());
  }

  SnapshotHeader header;
  if (!in.read(reinterpret_cast<char*>(&header), sizeof(header))) {
    throw std::runtime_error("truncated snapshot header");
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid snapshot magic");
  }

  SnapshotRecord record;
  record.sequence = header.sequence;
  record.payload.resize(header.payload_size);
  if (header.payload_size > 0 &&
      !in.read(reinterpret_cast<char*>(record.payload.data()), static_cast<std::streamsize>(header.payload_size))) {
    throw std::runtime_error("truncated snapshot payload");
  }
  if (wal::checksum32(record.payload) != header.checksum) {
    throw std::runtime_error("snapshot checksum mismatch");
  }
  return record;
}

}  // namespace snapshot
}  // namespace lendcore
