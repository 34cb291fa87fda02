#pragma once
/**
 * @file service_metrics.h
 * @brief Lock-free counters and latency histograms for the proximity service.
 *
 * Writers only touch atomics, so recording from hot paths (ingest, query,
 * cache) never contends with readers taking a snapshot.
 */

#include "sched/metrics_sink.h"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace sched {

enum class Counter : std::size_t {
  INGEST_ACCEPTED = 0,
  INGEST_ADVISORY,
  INGEST_DUPLICATE,
  INGEST_INVALID,
  INGEST_PRECISION,
  INGEST_BACKPRESSURE,
  INGEST_CORRUPTION,
  QUERIES,
  QUERY_REJECTED,
  QUERY_DEGRADED,
  QUERY_BACKPRESSURE,
  CACHE_HIT,
  CACHE_MISS,
  CACHE_ERROR,
  ENTITIES_REMOVED,
  ENTITIES_PURGED,
  COUNT
};

enum class Timer : std::size_t {
  INGEST = 0,
  QUERY,
  COUNT
};

const char* ToString(Counter c);
const char* ToString(Timer t);

struct HistogramSnapshot {
  std::uint64_t count = 0;
  double sum_ms = 0.0;
  double max_ms = 0.0;
  double last_ms = 0.0;
  std::array<std::uint64_t, 12> buckets{};  // upper bounds: LatencyHistogram::kBoundsMs, last = overflow

  double MeanMs() const { return count ? sum_ms / static_cast<double>(count) : 0.0; }
  // Upper bound of the bucket containing quantile q (q in [0,1]).
  double QuantileMs(double q) const;
};

class LatencyHistogram {
public:
  static constexpr std::array<double, 11> kBoundsMs = {
    0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 25.0, 50.0, 100.0
  };

  void Record(double ms);
  HistogramSnapshot Snapshot() const;
  void Reset();

private:
  std::array<std::atomic<std::uint64_t>, 12> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_ns_{0};
  std::atomic<std::uint64_t> max_ns_{0};
  std::atomic<std::uint64_t> last_ns_{0};
};

struct MetricsSnapshot {
  std::array<std::uint64_t, static_cast<std::size_t>(Counter::COUNT)> counters{};
  std::array<HistogramSnapshot, static_cast<std::size_t>(Timer::COUNT)> timers{};
  double uptime_s = 0.0;
  std::uint64_t cell_contention = 0;

  std::uint64_t Get(Counter c) const { return counters[static_cast<std::size_t>(c)]; }
  const HistogramSnapshot& Get(Timer t) const { return timers[static_cast<std::size_t>(t)]; }

  std::uint64_t IngestTotal() const;
  double IngestRatePerS() const;
  double CacheHitRatio() const;
};

class ServiceMetrics {
public:
  ServiceMetrics();

  void Increment(Counter c, std::uint64_t n = 1);
  void Observe(Timer t, double ms);

  // Cell contention is owned by the index; the service forwards it here.
  void SetCellContention(std::uint64_t n) { contention_.store(n, std::memory_order_relaxed); }

  MetricsSnapshot Snapshot() const;
  void Reset();

  // Push a snapshot to a telemetry sink (no-op when sink is null).
  void EmitTo(IMetricsSink* sink) const;

private:
  std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(Counter::COUNT)> counters_{};
  std::array<LatencyHistogram, static_cast<std::size_t>(Timer::COUNT)> timers_{};
  std::atomic<std::uint64_t> contention_{0};
  std::chrono::steady_clock::time_point started_;
};

// Records elapsed wall time into a timer on destruction.
class ScopedTimer {
public:
  ScopedTimer(ServiceMetrics* m, Timer t)
      : m_(m), t_(t), t0_(std::chrono::high_resolution_clock::now()) {}
  ~ScopedTimer() {
    if (!m_) return;
    const auto t1 = std::chrono::high_resolution_clock::now();
    m_->Observe(t_, std::chrono::duration<double, std::milli>(t1 - t0_).count());
  }
  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
  ServiceMetrics* m_;
  Timer t_;
  std::chrono::high_resolution_clock::time_point t0_;
};

} // namespace sched
