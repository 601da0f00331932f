#include "lendcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace lendcore {
namespace telemetry {

// bucket[i] covers [2^(i-1), 2^i); bucket 0 holds non-positive values.
std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_upper_bound(std::size_t idx) noexcept {
  return static_cast<std::int64_t>(1) << idx;
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  *this = StreamingHistogram{};
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(static_cast<double>(count_) * p));
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      // Never report beyond what was actually observed.
      return static_cast<double>(std::min(bucket_upper_bound(idx), max_));
    }
  }
  return static_cast<double>(max_);
}

TelemetrySink::TelemetrySink(std::size_t buffer_size, bool enabled)
    : buffer_size_(buffer_size), enabled_(enabled) {}

void TelemetrySink::push(Sample sample) {
  if (!enabled_) {
    return;
  }
  std::scoped_lock lock(mutex_);
  totals_[sample.id % kMaxMetricId] += sample.value;
  if (buffer_size_ == 0) {
    return;
  }
  if (buffer_.size() == buffer_size_) {
    buffer_.pop_front();
  }
  buffer_.push_back(sample);
}

void TelemetrySink::increment(std::uint64_t id, std::int64_t delta) {
  push(Sample{.id = id, .value = delta});
}

void TelemetrySink::record_latency(std::uint64_t id, std::chrono::nanoseconds latency) {
  if (!enabled_) {
    return;
  }
  std::scoped_lock lock(mutex_);
  histograms_[id % kMaxMetricId].record(latency.count());
}

std::int64_t TelemetrySink::total(std::uint64_t id) const {
  std::scoped_lock lock(mutex_);
  return totals_[id % kMaxMetricId];
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  std::vector<Sample> out(buffer_.begin(), buffer_.end());
  buffer_.clear();
  return out;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;

  for (std::size_t idx = 0; idx < kMaxMetricId; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(Summary{
        .id = static_cast<std::uint64_t>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
        .max_ns = hist.max(),
    });
    hist.reset();
  }
  return summaries;
}

}  // namespace telemetry
}  // namespace lendcore
