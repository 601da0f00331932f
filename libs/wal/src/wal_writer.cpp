#include "lendcore/wal/wal_writer.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

namespace lendcore {
namespace wal {

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  // FNV-1a
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= std::to_integer<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : path_(path), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  open_and_recover();
}

Writer::~Writer() {
  if (!write_buffer()) {
    std::fputs("lendcore: dropped unflushed WAL records on close\n", stderr);
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open_and_recover() {
  file_ = std::fopen(path_.c_str(), "ab+");
  if (!file_) {
    throw std::system_error(errno, std::system_category(), "failed to open WAL file: " + path_.string());
  }
  // Records are batched in buffer_; stdio must not hold back a partial write.
  std::setvbuf(file_, nullptr, _IONBF, 0);

  try {
    Reader reader(path_);
    Record record;
    while (reader.next(record)) {
      next_sequence_ = record.header.sequence + 1;
    }
    struct stat st {};
    if (::fstat(::fileno(file_), &st) != 0) {
      throw std::system_error(errno, std::system_category(), "failed to stat WAL file");
    }
    if (st.st_size > reader.valid_end() && ::ftruncate(::fileno(file_), reader.valid_end()) != 0) {
      throw std::system_error(errno, std::system_category(), "failed to drop torn WAL tail");
    }
  } catch (...) {
    std::fclose(file_);
    file_ = nullptr;
    throw;
  }
  written_sequence_ = next_sequence_;
}

common::SequenceId Writer::append(std::uint8_t kind, std::span<const std::byte> payload) {
  if (!file_) {
    throw std::runtime_error("WAL writer not open");
  }

  RecordHeader header;
  header.kind = kind;
  header.sequence = next_sequence_++;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = checksum32(payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

bool Writer::write_buffer() noexcept {
  if (!file_ || buffer_.empty()) {
    return true;
  }
  struct stat st {};
  if (::fstat(::fileno(file_), &st) != 0) {
    return false;
  }
  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size() || std::fflush(file_) != 0) {
    // Cut the partial write off and forget the batch.
    std::clearerr(file_);
    if (::ftruncate(::fileno(file_), st.st_size) != 0) {
      std::fputs("lendcore: failed to truncate torn WAL write\n", stderr);
    }
    buffer_.clear();
    next_sequence_ = written_sequence_;
    return false;
  }
  buffer_.clear();
  written_sequence_ = next_sequence_;
  return true;
}

void Writer::flush() {
  if (!write_buffer()) {
    throw std::runtime_error("failed to write WAL buffer, unwritten records dropped: " + path_.string());
  }
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  if (::fsync(::fileno(file_)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

Reader::Reader(const std::filesystem::path& path) : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::system_error(errno, std::system_category(), "failed to open WAL for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  if (std::fread(&header, sizeof(RecordHeader), 1, file_) != 1) {
    return false;
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid WAL magic in " + path_.string());
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported WAL version in " + path_.string());
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0 &&
      std::fread(out_record.payload.data(), 1, header.payload_size, file_) != header.payload_size) {
    // Torn final record from an interrupted write.
    return false;
  }
  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("WAL checksum mismatch at sequence " + std::to_string(header.sequence));
  }
  valid_end_ = std::ftell(file_);
  return true;
}

void Reader::seek_sequence(common::SequenceId sequence) {
  if (!file_) {
    return;
  }
  std::rewind(file_);
  valid_end_ = 0;
  Record record;
  long position = 0;
  while (next(record)) {
    if (record.header.sequence >= sequence) {
      if (std::fseek(file_, position, SEEK_SET) != 0) {
        throw std::runtime_error("failed to seek in WAL");
      }
      valid_end_ = position;
      return;
    }
    position = std::ftell(file_);
  }
}

}  // namespace wal
}  // namespace lendcore
