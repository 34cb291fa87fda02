#include "sched/service_metrics.h"

#include <algorithm>
#include <cmath>

namespace sched {

const char* ToString(Counter c) {
  switch (c) {
    case Counter::INGEST_ACCEPTED:     return "ingest_accepted";
    case Counter::INGEST_ADVISORY:     return "ingest_advisory";
    case Counter::INGEST_DUPLICATE:    return "ingest_duplicate";
    case Counter::INGEST_INVALID:      return "ingest_rejected_invalid";
    case Counter::INGEST_PRECISION:    return "ingest_rejected_precision";
    case Counter::INGEST_BACKPRESSURE: return "ingest_backpressure";
    case Counter::INGEST_CORRUPTION:   return "ingest_index_corruption";
    case Counter::QUERIES:             return "queries";
    case Counter::QUERY_REJECTED:      return "queries_rejected";
    case Counter::QUERY_DEGRADED:      return "queries_degraded";
    case Counter::QUERY_BACKPRESSURE:  return "queries_backpressure";
    case Counter::CACHE_HIT:           return "cache_hits";
    case Counter::CACHE_MISS:          return "cache_misses";
    case Counter::CACHE_ERROR:         return "cache_errors";
    case Counter::ENTITIES_REMOVED:    return "entities_removed";
    case Counter::ENTITIES_PURGED:     return "entities_purged";
    case Counter::COUNT:               break;
  }
  return "unknown";
}

const char* ToString(Timer t) {
  switch (t) {
    case Timer::INGEST: return "ingest_latency";
    case Timer::QUERY:  return "query_latency";
    case Timer::COUNT:  break;
  }
  return "unknown";
}

double HistogramSnapshot::QuantileMs(double q) const {
  if (count == 0) return 0.0;
  q = std::min(std::max(q, 0.0), 1.0);
  const std::uint64_t target = static_cast<std::uint64_t>(std::ceil(q * static_cast<double>(count)));
  std::uint64_t acc = 0;
  for (std::size_t i = 0; i < buckets.size(); ++i) {
    acc += buckets[i];
    if (acc >= target && acc > 0) {
      return (i < LatencyHistogram::kBoundsMs.size()) ? LatencyHistogram::kBoundsMs[i] : max_ms;
    }
  }
  return max_ms;
}

static std::uint64_t ms_to_ns(double ms) {
  if (!(ms > 0.0)) return 0;
  return static_cast<std::uint64_t>(ms * 1e6);
}

void LatencyHistogram::Record(double ms) {
  std::size_t b = kBoundsMs.size();
  for (std::size_t i = 0; i < kBoundsMs.size(); ++i) {
    if (ms <= kBoundsMs[i]) { b = i; break; }
  }
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);

  const std::uint64_t ns = ms_to_ns(ms);
  sum_ns_.fetch_add(ns, std::memory_order_relaxed);
  last_ns_.store(ns, std::memory_order_relaxed);
  std::uint64_t prev = max_ns_.load(std::memory_order_relaxed);
  while (ns > prev && !max_ns_.compare_exchange_weak(prev, ns, std::memory_order_relaxed)) {
  }
}

HistogramSnapshot LatencyHistogram::Snapshot() const {
  HistogramSnapshot s;
  for (std::size_t i = 0; i < buckets_.size(); ++i) {
    s.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
  }
  s.count = count_.load(std::memory_order_relaxed);
  s.sum_ms = static_cast<double>(sum_ns_.load(std::memory_order_relaxed)) * 1e-6;
  s.max_ms = static_cast<double>(max_ns_.load(std::memory_order_relaxed)) * 1e-6;
  s.last_ms = static_cast<double>(last_ns_.load(std::memory_order_relaxed)) * 1e-6;
  return s;
}

void LatencyHistogram::Reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_ns_.store(0, std::memory_order_relaxed);
  max_ns_.store(0, std::memory_order_relaxed);
  last_ns_.store(0, std::memory_order_relaxed);
}

std::uint64_t MetricsSnapshot::IngestTotal() const {
  return Get(Counter::INGEST_ACCEPTED) + Get(Counter::INGEST_ADVISORY) + Get(Counter::INGEST_DUPLICATE) +
         Get(Counter::INGEST_INVALID) + Get(Counter::INGEST_PRECISION) +
         Get(Counter::INGEST_BACKPRESSURE) + Get(Counter::INGEST_CORRUPTION);
}

double MetricsSnapshot::IngestRatePerS() const {
  return (uptime_s > 0.0) ? static_cast<double>(IngestTotal()) / uptime_s : 0.0;
}

double MetricsSnapshot::CacheHitRatio() const {
  const double hits = static_cast<double>(Get(Counter::CACHE_HIT));
  const double total = hits + static_cast<double>(Get(Counter::CACHE_MISS));
  return (total > 0.0) ? hits / total : 0.0;
}

ServiceMetrics::ServiceMetrics() : started_(std::chrono::steady_clock::now()) {}

void ServiceMetrics::Increment(Counter c, std::uint64_t n) {
  counters_[static_cast<std::size_t>(c)].fetch_add(n, std::memory_order_relaxed);
}

void ServiceMetrics::Observe(Timer t, double ms) {
  timers_[static_cast<std::size_t>(t)].Record(ms);
}

MetricsSnapshot ServiceMetrics::Snapshot() const {
  MetricsSnapshot s;
  for (std::size_t i = 0; i < counters_.size(); ++i) {
    s.counters[i] = counters_[i].load(std::memory_order_relaxed);
  }
  for (std::size_t i = 0; i < timers_.size(); ++i) {
    s.timers[i] = timers_[i].Snapshot();
  }
  s.uptime_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
  s.cell_contention = contention_.load(std::memory_order_relaxed);
  return s;
}

void ServiceMetrics::Reset() {
  for (auto& c : counters_) c.store(0, std::memory_order_relaxed);
  for (auto& t : timers_) t.Reset();
  contention_.store(0, std::memory_order_relaxed);
}

void ServiceMetrics::EmitTo(IMetricsSink* sink) const {
  if (!sink) return;
  const MetricsSnapshot s = Snapshot();
  for (std::size_t i = 0; i < s.counters.size(); ++i) {
    sink->EmitCounter(ToString(static_cast<Counter>(i)), s.counters[i]);
  }
  for (std::size_t i = 0; i < s.timers.size(); ++i) {
    const HistogramSnapshot& h = s.timers[i];
    sink->EmitHistogram(ToString(static_cast<Timer>(i)), static_cast<double>(h.count),
                        h.QuantileMs(0.5), h.QuantileMs(0.99), h.max_ms);
  }
  sink->EmitGauge("ingest_rate_per_s", s.IngestRatePerS());
  sink->EmitGauge("cache_hit_ratio", s.CacheHitRatio());
  sink->EmitGauge("cell_contention", static_cast<double>(s.cell_contention));
}

} // namespace sched
