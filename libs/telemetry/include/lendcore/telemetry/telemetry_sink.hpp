#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace lendcore {
namespace telemetry {

struct Sample {
  std::uint64_t id{};
  std::int64_t value{};
};

// log2-bucketed latency histogram, 1ns to ~1s.
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_upper_bound(std::size_t idx) noexcept;
};

// Counters and latencies keyed by small metric ids. Samples are buffered for
// an exporter to drain; running totals stay queryable.
class TelemetrySink {
 public:
  static constexpr std::size_t kMaxMetricId = 256;

  explicit TelemetrySink(std::size_t buffer_size = 1024, bool enabled = true);

  void push(Sample sample);
  void increment(std::uint64_t id, std::int64_t delta = 1);
  void record_latency(std::uint64_t id, std::chrono::nanoseconds latency);

  [[nodiscard]] std::int64_t total(std::uint64_t id) const;
  [[nodiscard]] std::vector<Sample> drain();

  struct Summary {
    std::uint64_t id{0};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
    std::int64_t max_ns{0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  mutable std::mutex mutex_;
  std::size_t buffer_size_;
  bool enabled_;
  std::deque<Sample> buffer_{};
  std::array<std::int64_t, kMaxMetricId> totals_{};
  std::array<StreamingHistogram, kMaxMetricId> histograms_{};
};

}  // namespace telemetry
}  // namespace lendcore
