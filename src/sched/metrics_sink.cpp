#include "sched/metrics_sink.h"

#include <ostream>
#include <utility>

namespace sched {

StreamMetricsSink::StreamMetricsSink(std::ostream& os, std::string prefix)
    : os_(os), prefix_(std::move(prefix)) {}

void StreamMetricsSink::EmitCounter(const std::string& name, std::uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  os_ << "metric " << prefix_ << name << " " << value << "\n";
}

void StreamMetricsSink::EmitHistogram(const std::string& name, double count,
                                      double p50_ms, double p99_ms, double max_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  os_ << "metric " << prefix_ << name
      << " count=" << count
      << " p50_ms=" << p50_ms
      << " p99_ms=" << p99_ms
      << " max_ms=" << max_ms << "\n";
}

void StreamMetricsSink::EmitGauge(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  os_ << "metric " << prefix_ << name << " " << value << "\n";
}

} // namespace sched
