#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace wal {

inline constexpr std::uint32_t kMagic = 0x4c43574c;  // 'LCWL'
inline constexpr std::uint16_t kVersion = 1;

struct RecordHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{kVersion};
  std::uint8_t kind{0};
  std::uint8_t reserved{0};
  common::SequenceId sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Append-only journal. Sequence numbers start at 1 and continue across
// reopenings of the same file. A failed write is cut back off the file and
// its buffered records are dropped, so the file only ever ends on a whole
// record. Opening a file whose last record is torn truncates that record.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Buffers one record and returns the sequence assigned to it. Throws when
  // the buffer has to be written and the write fails.
  common::SequenceId append(std::uint8_t kind, std::span<const std::byte> payload);
  void flush();
  void sync();
  [[nodiscard]] common::SequenceId next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  common::SequenceId next_sequence_{1};
  // First sequence not yet written to the file.
  common::SequenceId written_sequence_{1};

  void open_and_recover();
  bool write_buffer() noexcept;
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at end of file, including a torn final record. Throws on records
  // that are complete but corrupt.
  bool next(Record& out_record);
  void seek_sequence(common::SequenceId sequence);
  // Byte offset just past the last whole record read.
  [[nodiscard]] long valid_end() const noexcept { return valid_end_; }

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
  long valid_end_{0};
};

std::uint32_t checksum32(std::span<const std::byte> data) noexcept;

}  // namespace wal
}  // namespace lendcore
