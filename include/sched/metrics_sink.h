#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace sched {

// Telemetry collaborator. Emission is fire-and-forget: implementations must
// not throw and must not block for long.
class IMetricsSink {
public:
  virtual ~IMetricsSink() = default;
  virtual void EmitCounter(const std::string& name, std::uint64_t value) = 0;
  virtual void EmitHistogram(const std::string& name, double count, double p50_ms, double p99_ms, double max_ms) = 0;
  virtual void EmitGauge(const std::string& name, double value) = 0;
};

// Line-oriented text sink ("metric <name> <value>"), e.g. std::cout or a file.
class StreamMetricsSink final : public IMetricsSink {
public:
  StreamMetricsSink(std::ostream& os, std::string prefix);

  void EmitCounter(const std::string& name, std::uint64_t value) override;
  void EmitHistogram(const std::string& name, double count, double p50_ms, double p99_ms, double max_ms) override;
  void EmitGauge(const std::string& name, double value) override;

private:
  std::ostream& os_;
  std::string prefix_;
  std::mutex mu_;
};

} // namespace sched
