#define BOOST_TEST_MODULE SchedTests
#include <boost/test/unit_test.hpp>

#include "sched/metrics_sink.h"
#include "sched/service_metrics.h"
#include "sched/worker_pool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

class RecordingSink final : public sched::IMetricsSink {
public:
  void EmitCounter(const std::string& name, std::uint64_t value) override { counters[name] = value; }
  void EmitHistogram(const std::string& name, double count, double p50_ms, double, double) override {
    histogram_counts[name] = count;
    histogram_p50[name] = p50_ms;
  }
  void EmitGauge(const std::string& name, double value) override { gauges[name] = value; }

  std::map<std::string, std::uint64_t> counters;
  std::map<std::string, double> histogram_counts;
  std::map<std::string, double> histogram_p50;
  std::map<std::string, double> gauges;
};

// Occupies one worker until Release() is called.
struct Gate {
  std::promise<void> started;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();

  std::function<void()> Task() {
    return [this]() {
      started.set_value();
      released.wait();
    };
  }
  void Release() { release.set_value(); }
};

} // namespace

BOOST_AUTO_TEST_SUITE(WorkerPoolTests)

BOOST_AUTO_TEST_CASE(SubmitReturnsValueThroughFuture) {
  sched::WorkerPool pool("t", 2, 8);
  auto fut = pool.TrySubmit([]() { return 6 * 7; });
  BOOST_REQUIRE(fut.has_value());
  BOOST_CHECK_EQUAL(fut->get(), 42);
}

BOOST_AUTO_TEST_CASE(ExceptionSurfacesThroughFuture) {
  sched::WorkerPool pool("t", 1, 4);
  auto fut = pool.TrySubmit([]() -> int { throw std::runtime_error("boom"); });
  BOOST_REQUIRE(fut.has_value());
  BOOST_CHECK_THROW(fut->get(), std::runtime_error);

  pool.Drain();
  BOOST_CHECK_EQUAL(pool.GetStats().completed, 1u);
}

BOOST_AUTO_TEST_CASE(FullQueueRejectsWithoutBlocking) {
  sched::WorkerPool pool("t", 1, 2);
  Gate gate;
  auto started = gate.started.get_future();

  BOOST_REQUIRE(pool.TryPost(gate.Task()));
  started.wait();  // the only worker is now busy

  BOOST_CHECK(pool.TryPost([]() {}));
  BOOST_CHECK(pool.TryPost([]() {}));
  BOOST_CHECK(!pool.TryPost([]() {}));
  BOOST_CHECK(!pool.TrySubmit([]() { return 1; }).has_value());
  BOOST_CHECK_EQUAL(pool.QueueDepth(), 2u);

  gate.Release();
  pool.Drain();

  const sched::PoolStats s = pool.GetStats();
  BOOST_CHECK_EQUAL(s.submitted, 3u);
  BOOST_CHECK_EQUAL(s.rejected, 2u);
  BOOST_CHECK_EQUAL(s.completed, 3u);
  BOOST_CHECK_EQUAL(s.max_depth, 2u);
  BOOST_CHECK_EQUAL(pool.QueueDepth(), 0u);
}

BOOST_AUTO_TEST_CASE(FailedPostIsCounted) {
  sched::WorkerPool pool("t", 1, 4);
  BOOST_REQUIRE(pool.TryPost([]() { throw std::runtime_error("expected failure"); }));
  pool.Drain();
  BOOST_CHECK_EQUAL(pool.GetStats().failed, 1u);
}

BOOST_AUTO_TEST_CASE(ShutdownFinishesQueuedWorkAndRejectsNew) {
  std::atomic<int> ran{0};
  sched::WorkerPool pool("t", 2, 64);
  for (int i = 0; i < 50; ++i) {
    BOOST_REQUIRE(pool.TryPost([&ran]() {
      std::this_thread::sleep_for(std::chrono::microseconds(100));
      ran.fetch_add(1);
    }));
  }
  pool.Shutdown();
  BOOST_CHECK_EQUAL(ran.load(), 50);
  BOOST_CHECK(!pool.TryPost([]() {}));
  BOOST_CHECK_NO_THROW(pool.Shutdown());
  BOOST_CHECK_EQUAL(pool.NumThreads(), 0u);
}

BOOST_AUTO_TEST_CASE(InvalidConstructionThrows) {
  BOOST_CHECK_THROW(sched::WorkerPool("t", 0, 4), std::runtime_error);
  BOOST_CHECK_THROW(sched::WorkerPool("t", 1, 0), std::runtime_error);

  sched::WorkerPool pool("t", 1, 1);
  BOOST_CHECK_THROW(pool.TryPost(std::function<void()>{}), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ServiceMetricsTests)

BOOST_AUTO_TEST_CASE(CountersAndDerivedRatios) {
  sched::ServiceMetrics m;
  m.Increment(sched::Counter::INGEST_ACCEPTED, 5);
  m.Increment(sched::Counter::INGEST_PRECISION);
  m.Increment(sched::Counter::INGEST_BACKPRESSURE, 2);
  m.Increment(sched::Counter::CACHE_HIT, 3);
  m.Increment(sched::Counter::CACHE_MISS);
  m.SetCellContention(17);

  const sched::MetricsSnapshot s = m.Snapshot();
  BOOST_CHECK_EQUAL(s.Get(sched::Counter::INGEST_ACCEPTED), 5u);
  BOOST_CHECK_EQUAL(s.IngestTotal(), 8u);
  BOOST_CHECK_CLOSE(s.CacheHitRatio(), 0.75, 1e-9);
  BOOST_CHECK_EQUAL(s.cell_contention, 17u);
  BOOST_CHECK_GE(s.uptime_s, 0.0);

  m.Reset();
  const sched::MetricsSnapshot z = m.Snapshot();
  BOOST_CHECK_EQUAL(z.IngestTotal(), 0u);
  BOOST_CHECK_EQUAL(z.CacheHitRatio(), 0.0);
  BOOST_CHECK_EQUAL(z.cell_contention, 0u);
}

BOOST_AUTO_TEST_CASE(HistogramQuantilesUseBucketBounds) {
  sched::ServiceMetrics m;
  for (int i = 0; i < 90; ++i) m.Observe(sched::Timer::QUERY, 0.2);   // <= 0.25 bucket
  for (int i = 0; i < 10; ++i) m.Observe(sched::Timer::QUERY, 30.0);  // <= 50 bucket
  m.Observe(sched::Timer::INGEST, 500.0);                              // overflow

  const sched::MetricsSnapshot s = m.Snapshot();
  const sched::HistogramSnapshot& q = s.Get(sched::Timer::QUERY);
  BOOST_CHECK_EQUAL(q.count, 100u);
  BOOST_CHECK_EQUAL(q.QuantileMs(0.5), 0.25);
  BOOST_CHECK_EQUAL(q.QuantileMs(0.9), 0.25);
  BOOST_CHECK_EQUAL(q.QuantileMs(0.99), 50.0);
  BOOST_CHECK_CLOSE(q.max_ms, 30.0, 1e-6);
  BOOST_CHECK_CLOSE(q.MeanMs(), 3.18, 1e-3);

  const sched::HistogramSnapshot& in = s.Get(sched::Timer::INGEST);
  BOOST_CHECK_CLOSE(in.QuantileMs(0.5), 500.0, 1e-6);  // overflow reports the max
  BOOST_CHECK_EQUAL(sched::HistogramSnapshot{}.QuantileMs(0.5), 0.0);
}

BOOST_AUTO_TEST_CASE(ScopedTimerRecordsOnce) {
  sched::ServiceMetrics m;
  {
    sched::ScopedTimer t(&m, sched::Timer::INGEST);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  { sched::ScopedTimer ignored(nullptr, sched::Timer::INGEST); }

  const sched::HistogramSnapshot h = m.Snapshot().Get(sched::Timer::INGEST);
  BOOST_CHECK_EQUAL(h.count, 1u);
  BOOST_CHECK_GE(h.last_ms, 1.0);
}

BOOST_AUTO_TEST_CASE(ConcurrentIncrementsAreExact) {
  sched::ServiceMetrics m;
  std::thread a([&]() { for (int i = 0; i < 10000; ++i) m.Increment(sched::Counter::QUERIES); });
  std::thread b([&]() { for (int i = 0; i < 10000; ++i) m.Increment(sched::Counter::QUERIES); });
  a.join();
  b.join();
  BOOST_CHECK_EQUAL(m.Snapshot().Get(sched::Counter::QUERIES), 20000u);
}

BOOST_AUTO_TEST_CASE(EmitToReportsEveryCounterAndGauge) {
  sched::ServiceMetrics m;
  m.Increment(sched::Counter::QUERY_DEGRADED, 4);
  m.Observe(sched::Timer::QUERY, 0.3);

  RecordingSink sink;
  m.EmitTo(&sink);
  BOOST_CHECK_NO_THROW(m.EmitTo(nullptr));

  BOOST_CHECK_EQUAL(sink.counters.size(), static_cast<std::size_t>(sched::Counter::COUNT));
  BOOST_CHECK_EQUAL(sink.counters["queries_degraded"], 4u);
  BOOST_CHECK_EQUAL(sink.histogram_counts["query_latency"], 1.0);
  BOOST_CHECK_EQUAL(sink.histogram_p50["query_latency"], 0.5);
  BOOST_CHECK(sink.gauges.count("cache_hit_ratio"));
  BOOST_CHECK(sink.gauges.count("cell_contention"));
}

BOOST_AUTO_TEST_CASE(StreamSinkWritesPrefixedLines) {
  std::ostringstream os;
  sched::StreamMetricsSink sink(os, "proximity.");
  sink.EmitCounter("queries", 12);
  sink.EmitGauge("cell_contention", 3);

  const std::string out = os.str();
  BOOST_CHECK_NE(out.find("metric proximity.queries 12\n"), std::string::npos);
  BOOST_CHECK_NE(out.find("metric proximity.cell_contention 3\n"), std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
