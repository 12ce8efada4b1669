#include "lendcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace lendcore {
namespace telemetry {

std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx < 2) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);  // 1.5 * 2^(idx-1)
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  min_ = std::min(min_, value_ns);
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  min_ = std::numeric_limits<std::int64_t>::max();
  max_ = 0;
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

  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;

  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }

  return static_cast<double>(max_);
}

void TelemetrySink::increment(std::uint64_t id, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  counters_[id % kMaxMetricId] += delta;
}

void TelemetrySink::record_latency(std::uint64_t id, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[id % kMaxMetricId].record(latency.count());
}

std::vector<Sample> TelemetrySink::drain_counters() {
  std::scoped_lock lock(mutex_);
  std::vector<Sample> samples;
  for (std::size_t idx = 0; idx < kMaxMetricId; ++idx) {
    if (counters_[idx] == 0) {
      continue;
    }
    samples.push_back(Sample{.id = static_cast<std::uint64_t>(idx), .value = counters_[idx]});
    counters_[idx] = 0;
  }
  return samples;
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
    });

    hist.reset();
  }

  return summaries;
}

}  // namespace telemetry
}  // namespace lendcore
