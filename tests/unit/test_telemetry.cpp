#include "test_telemetry.hpp"

#include <cassert>
#include <chrono>

#include "lendcore/telemetry/telemetry_sink.hpp"

namespace lendcore::tests {

void test_telemetry_sink() {
  telemetry::StreamingHistogram histogram;
  assert(histogram.count() == 0);
  assert(histogram.percentile(0.99) == 0.0);

  for (int i = 0; i < 99; ++i) {
    histogram.record(100);
  }
  histogram.record(1'000'000);
  assert(histogram.count() == 100);
  assert(histogram.max() == 1'000'000);
  assert(histogram.mean() == (99.0 * 100 + 1'000'000) / 100.0);
  // 100ns lands in [64, 128).
  assert(histogram.percentile(0.5) == 96.0);
  histogram.record(1);
  histogram.record(0);
  histogram.reset();
  assert(histogram.count() == 0);
  assert(histogram.max() == 0);

  telemetry::TelemetrySink sink;
  sink.increment(4);
  sink.increment(4, 2);
  sink.increment(8);
  sink.record_latency(4, std::chrono::nanoseconds{500});
  sink.record_latency(4, std::chrono::nanoseconds{700});

  const auto counters = sink.drain_counters();
  assert(counters.size() == 2);
  assert(counters[0].id == 4);
  assert(counters[0].value == 3);
  assert(counters[1].id == 8);
  assert(sink.drain_counters().empty());

  const auto latency = sink.drain_latency();
  assert(latency.size() == 1);
  assert(latency[0].id == 4);
  assert(latency[0].count == 2);
  assert(latency[0].mean_ns == 600.0);
  assert(sink.drain_latency().empty());
}

}  // namespace lendcore::tests
