#define BOOST_TEST_MODULE ProximityServiceTests
#include <boost/test/unit_test.hpp>

#include "cache/cache_store.h"
#include "cache/cell_result_codec.h"
#include "cache/memory_cache_store.h"
#include "prox_api/proximity_service.h"

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr double kStart = 1000.0;

prox::SpatialSample lidar_at(double lat, double lon, double t, double acc = 0.005) {
  prox::SpatialSample s;
  s.latitude_deg = lat;
  s.longitude_deg = lon;
  s.horizontal_accuracy_m = acc;
  s.vertical_accuracy_m = acc;
  s.timestamp_s = t;
  s.source_kind = prox::SourceKind::LIDAR;
  s.confidence = 0.95;
  return s;
}

query::QueryRequest around(double lat, double lon, double radius) {
  query::QueryRequest q;
  q.latitude_deg = lat;
  q.longitude_deg = lon;
  q.radius_m = radius;
  return q;
}

prox_api::ServiceOptions test_options() {
  prox_api::ServiceOptions o;
  o.maintenance_interval_s = 0.0;
  o.request_threads = 2;
  o.request_queue_capacity = 64;
  o.worker_threads = 1;
  o.worker_queue_capacity = 16;
  o.query.default_budget_ms = 10000.0;
  return o;
}

class RecordingSink final : public sched::IMetricsSink {
public:
  void EmitCounter(const std::string& name, std::uint64_t value) override {
    std::lock_guard<std::mutex> lock(mu);
    counters[name] = value;
    ++emits;
  }
  void EmitHistogram(const std::string&, double, double, double, double) override {}
  void EmitGauge(const std::string&, double) override {}

  std::mutex mu;
  std::map<std::string, std::uint64_t> counters;
  int emits = 0;
};

class BrokenStore final : public cache::ICacheStore {
public:
  bool Get(const std::string&, cache::CacheRecord&) override { throw cache::CacheError("store offline"); }
  void Set(const std::string&, const cache::CacheRecord&) override { throw cache::CacheError("store offline"); }
  void Erase(const std::string&) override { throw cache::CacheError("store offline"); }
  std::size_t Purge(double) override { throw cache::CacheError("store offline"); }
  std::size_t Size() const override { return 0; }
  const char* Name() const override { return "broken"; }
};

// Memory store whose first Get parks the calling thread until Release().
class GatedStore final : public cache::ICacheStore {
public:
  bool Get(const std::string& key, cache::CacheRecord& out) override {
    if (!armed_.exchange(false)) return inner_.Get(key, out);
    entered_.set_value();
    released_.wait();
    return inner_.Get(key, out);
  }
  void Set(const std::string& key, const cache::CacheRecord& rec) override { inner_.Set(key, rec); }
  void Erase(const std::string& key) override { inner_.Erase(key); }
  std::size_t Purge(double now_s) override { return inner_.Purge(now_s); }
  std::size_t Size() const override { return inner_.Size(); }
  const char* Name() const override { return "gated"; }

  std::future<void> Entered() { return entered_.get_future(); }
  void Release() { release_.set_value(); }

private:
  cache::MemoryCacheStore inner_{1024};
  std::atomic<bool> armed_{true};
  std::promise<void> entered_;
  std::promise<void> release_;
  std::shared_future<void> released_ = release_.get_future().share();
};

struct ServiceFixture {
  ServiceFixture() : now(kStart), service(test_options(), [this]() { return now.load(); }) {}

  std::atomic<double> now;
  prox_api::ProximityService service;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ProximityServiceTests, ServiceFixture)

BOOST_AUTO_TEST_CASE(ScanThenDetectThenRemove) {
  ingest::EntityAttributes a;
  a.visibility_radius_m = 10.0;
  const prox_api::ScanReply s = service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart), a);
  BOOST_CHECK(s.accepted);
  BOOST_CHECK(s.ack == ingest::AckKind::ACCEPTED);
  BOOST_CHECK(!s.error.has_value());

  // ~16.7 m away: outside the entity's own 10 m visibility radius
  const prox_api::ProximityReply far = service.DetectProximity(around(0.0, 0.00015, 50.0));
  BOOST_REQUIRE(far.ok);
  BOOST_CHECK(far.entities.empty());

  // ~5.5 m away: visible, and the lone LiDAR fix makes the scan ULTRA
  const prox_api::ProximityReply near = service.DetectProximity(around(0.0, 0.00005, 10.0));
  BOOST_REQUIRE(near.ok);
  BOOST_REQUIRE_EQUAL(near.entities.size(), 1u);
  BOOST_CHECK_EQUAL(near.entities[0].id, 1u);
  BOOST_CHECK(near.scan_quality == query::ScanQuality::ULTRA);

  const prox_api::RemoveReply r = service.RemoveEntity(1);
  BOOST_CHECK(r.removed);
  BOOST_CHECK(!r.error.has_value());
  BOOST_CHECK(service.DetectProximity(around(0.0, 0.00005, 10.0)).entities.empty());
  BOOST_CHECK(!service.RemoveEntity(1).removed);
}

BOOST_AUTO_TEST_CASE(OutOfOrderSampleLeavesStateAlone) {
  BOOST_REQUIRE(service.ProcessScan(2, prox::EntityKind::USER, lidar_at(0.0, 0.0, 100.0)).accepted);

  const prox_api::ScanReply late = service.ProcessScan(2, prox::EntityKind::USER, lidar_at(0.0, 0.0001, 90.0));
  BOOST_CHECK(!late.accepted);
  BOOST_REQUIRE(late.error.has_value());
  BOOST_CHECK(*late.error == prox::IngestErrorKind::INVALID_DATA);
  BOOST_CHECK_NE(late.reason.find("out-of-order"), std::string::npos);

  prox::Entity e;
  BOOST_REQUIRE(service.Index().Lookup(2, e));
  BOOST_CHECK_EQUAL(e.position.timestamp_s, 100.0);
  BOOST_CHECK_EQUAL(e.position.longitude_deg, 0.0);
}

BOOST_AUTO_TEST_CASE(ImpreciseTagCreationIsPrecisionError) {
  const prox_api::ScanReply r = service.ProcessScan(3, prox::EntityKind::TAG, lidar_at(0.0, 0.0, kStart, 0.5));
  BOOST_CHECK(!r.accepted);
  BOOST_REQUIRE(r.error.has_value());
  BOOST_CHECK(*r.error == prox::IngestErrorKind::PRECISION_ERROR);
  BOOST_CHECK_EQUAL(service.Index().Size(), 0u);
  BOOST_CHECK_EQUAL(service.Metrics().Get(sched::Counter::INGEST_PRECISION), 1u);
}

BOOST_AUTO_TEST_CASE(OversizedRadiusIsInvalidRadius) {
  const prox_api::ProximityReply r = service.DetectProximity(around(0.0, 0.0, 60.0));
  BOOST_CHECK(!r.ok);
  BOOST_REQUIRE(r.error.has_value());
  BOOST_CHECK(*r.error == prox::QueryErrorKind::INVALID_RADIUS);
}

BOOST_AUTO_TEST_CASE(DuplicateScanIsAcknowledged) {
  const prox::SpatialSample s = lidar_at(0.0, 0.0, kStart);
  BOOST_REQUIRE(service.ProcessScan(4, prox::EntityKind::USER, s).accepted);
  const std::uint64_t v = service.Index().CellVersion(service.Index().CellFor(0.0, 0.0));

  const prox_api::ScanReply again = service.ProcessScan(4, prox::EntityKind::USER, s);
  BOOST_CHECK(again.accepted);
  BOOST_CHECK(again.ack == ingest::AckKind::DUPLICATE);
  BOOST_CHECK_EQUAL(service.Index().CellVersion(service.Index().CellFor(0.0, 0.0)), v);
}

BOOST_AUTO_TEST_CASE(UpdateLocationMovesExistingEntity) {
  ingest::EntityAttributes a;
  a.status_level = prox::StatusLevel::ELITE;
  BOOST_REQUIRE(service.ProcessScan(5, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart), a).accepted);

  const prox_api::ScanReply r = service.UpdateLocation(5, lidar_at(0.0, 0.0009, kStart + 1.0));
  BOOST_CHECK(r.accepted);

  prox::Entity e;
  BOOST_REQUIRE(service.Index().Lookup(5, e));
  BOOST_CHECK_GT(e.point.e_m, 90.0);
  BOOST_CHECK(e.status_level == prox::StatusLevel::ELITE);
}

BOOST_AUTO_TEST_CASE(HaltedCellSurfacesAsIndexCorruption) {
  BOOST_REQUIRE(service.ProcessScan(6, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart)).accepted);
  service.Index().HaltCell(service.Index().CellFor(1.0, 1.0), "simulated invariant violation");

  const prox_api::ScanReply r = service.ProcessScan(7, prox::EntityKind::USER, lidar_at(0.00001, 0.00001, kStart));
  BOOST_CHECK(!r.accepted);
  BOOST_REQUIRE(r.error.has_value());
  BOOST_CHECK(*r.error == prox::IngestErrorKind::INDEX_CORRUPTION);

  const prox_api::RemoveReply rm = service.RemoveEntity(6);
  BOOST_CHECK(!rm.removed);
  BOOST_REQUIRE(rm.error.has_value());
  BOOST_CHECK(*rm.error == prox::IngestErrorKind::INDEX_CORRUPTION);

  // reads keep working on the halted cell
  const prox_api::ProximityReply q = service.DetectProximity(around(0.0, 0.0, 10.0));
  BOOST_REQUIRE(q.ok);
  BOOST_CHECK_EQUAL(q.entities.size(), 1u);
}

BOOST_AUTO_TEST_CASE(MaintenancePurgesExpiredAndStale) {
  ingest::EntityAttributes tag;
  tag.has_expiry = true;
  tag.expires_at_s = kStart + 60.0;
  BOOST_REQUIRE(service.ProcessScan(10, prox::EntityKind::TAG, lidar_at(0.0, 0.0, kStart), tag).accepted);
  BOOST_REQUIRE(service.ProcessScan(11, prox::EntityKind::USER, lidar_at(0.0, 0.0001, kStart)).accepted);

  ingest::EntityAttributes forever;
  BOOST_REQUIRE(service.ProcessScan(12, prox::EntityKind::TAG, lidar_at(0.0001, 0.0, kStart), forever).accepted);

  BOOST_CHECK_EQUAL(service.RunMaintenance(), 0u);

  now = kStart + 61.0;
  BOOST_CHECK_EQUAL(service.RunMaintenance(), 1u);  // tag 10

  now = kStart + 400.0;
  BOOST_CHECK_EQUAL(service.RunMaintenance(), 1u);  // user 11 went stale
  BOOST_CHECK_EQUAL(service.Index().Size(), 1u);

  const sched::MetricsSnapshot m = service.Metrics();
  BOOST_CHECK_EQUAL(m.Get(sched::Counter::ENTITIES_PURGED), 2u);
}

BOOST_AUTO_TEST_CASE(RepeatQueryHitsCacheUntilWrite) {
  BOOST_REQUIRE(service.ProcessScan(20, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart)).accepted);

  BOOST_REQUIRE(service.DetectProximity(around(0.0, 0.0, 5.0)).ok);
  const std::uint64_t hits_before = service.Metrics().Get(sched::Counter::CACHE_HIT);
  BOOST_REQUIRE(service.DetectProximity(around(0.0, 0.0, 5.0)).ok);
  BOOST_CHECK_GT(service.Metrics().Get(sched::Counter::CACHE_HIT), hits_before);

  BOOST_REQUIRE(service.ProcessScan(21, prox::EntityKind::USER, lidar_at(0.00001, 0.0, kStart)).accepted);
  const prox_api::ProximityReply r = service.DetectProximity(around(0.0, 0.0, 5.0));
  BOOST_REQUIRE(r.ok);
  BOOST_CHECK_EQUAL(r.entities.size(), 2u);
}

BOOST_AUTO_TEST_CASE(AsyncCallsReturnThroughFutures) {
  std::vector<std::future<prox_api::ScanReply>> scans;
  for (prox::EntityId id = 100; id < 120; ++id) {
    const double lon = 0.00001 * static_cast<double>(id - 100);
    scans.push_back(service.SubmitScanAsync(id, prox::EntityKind::USER, lidar_at(0.0, lon, kStart)));
  }
  for (auto& f : scans) BOOST_CHECK(f.get().accepted);

  auto q = service.DetectProximityAsync(around(0.0, 0.0, 50.0));
  const prox_api::ProximityReply r = q.get();
  BOOST_REQUIRE(r.ok);
  BOOST_CHECK_EQUAL(r.entities.size(), 20u);
  for (std::size_t i = 1; i < r.entities.size(); ++i) {
    BOOST_CHECK_LE(r.entities[i - 1].distance_m, r.entities[i].distance_m);
  }
}

BOOST_AUTO_TEST_CASE(ShutdownIsIdempotent) {
  service.Shutdown();
  BOOST_CHECK_NO_THROW(service.Shutdown());

  // after shutdown, async work is refused rather than lost
  auto f = service.SubmitScanAsync(1, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart));
  const prox_api::ScanReply r = f.get();
  BOOST_CHECK(!r.accepted);
  BOOST_REQUIRE(r.error.has_value());
  BOOST_CHECK(*r.error == prox::IngestErrorKind::BACKPRESSURE);
}

BOOST_AUTO_TEST_CASE(BatchScansReplyPerElementInOrder) {
  std::vector<prox_api::ScanRequest> batch(4);
  batch[0].id = 1;
  batch[0].sample = lidar_at(0.0, 0.0, kStart);
  batch[1].id = 2;
  batch[1].sample = lidar_at(91.0, 0.0, kStart);
  batch[2] = batch[0];
  batch[3].id = 3;
  batch[3].kind = prox::EntityKind::TAG;
  batch[3].sample = lidar_at(0.0, 0.00003, kStart);

  const std::vector<prox_api::ScanReply> r = service.ProcessScans(batch);
  BOOST_REQUIRE_EQUAL(r.size(), 4u);
  BOOST_CHECK(r[0].accepted && r[0].ack == ingest::AckKind::ACCEPTED);
  BOOST_CHECK(!r[1].accepted);
  BOOST_REQUIRE(r[1].error.has_value());
  BOOST_CHECK(*r[1].error == prox::IngestErrorKind::INVALID_DATA);
  BOOST_CHECK(r[2].accepted && r[2].ack == ingest::AckKind::DUPLICATE);
  BOOST_CHECK(r[3].accepted);

  BOOST_CHECK_EQUAL(service.Index().Size(), 2u);
  BOOST_CHECK(service.ProcessScans({}).empty());
}

BOOST_AUTO_TEST_CASE(InteractionNeedsSupportingLidarFix) {
  const prox::SpatialSample a = lidar_at(0.0, 0.0, kStart);
  const prox::SpatialSample b = lidar_at(0.0, 0.00005, kStart);  // ~5.6 m east

  prox_api::InteractionReply r = service.CheckInteraction(a, b);
  BOOST_REQUIRE(r.ok);
  BOOST_CHECK_CLOSE(r.distance_m, 5.566, 0.5);
  BOOST_CHECK(!r.possible);
  BOOST_CHECK_EQUAL(r.confidence, 0.0);

  // a LiDAR fix between them supports the interaction
  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.000025, kStart)).accepted);
  r = service.CheckInteraction(a, b);
  BOOST_REQUIRE(r.ok);
  BOOST_CHECK(r.possible);
  BOOST_CHECK_CLOSE(r.confidence, 0.95, 1e-9);

  // closer than the minimum interaction distance
  r = service.CheckInteraction(a, lidar_at(0.0, 0.000004, kStart));
  BOOST_REQUIRE(r.ok);
  BOOST_CHECK_LT(r.distance_m, 0.5);
  BOOST_CHECK(!r.possible);
  BOOST_CHECK_EQUAL(r.confidence, 0.0);

  // farther apart than any query can reach
  r = service.CheckInteraction(a, lidar_at(0.0, 0.001, kStart));
  BOOST_REQUIRE(r.ok);
  BOOST_CHECK(!r.possible);

  // a weak fix is not enough
  prox::SpatialSample weak = lidar_at(0.001, 0.000025, kStart);
  weak.confidence = 0.6;
  BOOST_REQUIRE(service.ProcessScan(2, prox::EntityKind::USER, weak).accepted);
  r = service.CheckInteraction(lidar_at(0.001, 0.0, kStart), lidar_at(0.001, 0.00005, kStart));
  BOOST_REQUIRE(r.ok);
  BOOST_CHECK(!r.possible);
  BOOST_CHECK_CLOSE(r.confidence, 0.6, 1e-9);

  r = service.CheckInteraction(lidar_at(95.0, 0.0, kStart), b);
  BOOST_CHECK(!r.ok);
  BOOST_REQUIRE(r.error.has_value());
  BOOST_CHECK(*r.error == prox::QueryErrorKind::INVALID_DATA);
}

BOOST_AUTO_TEST_CASE(SubscriptionReportsEnteredAndLeft) {
  const prox_api::SubscribeReply sub = service.Subscribe(around(0.0, 0.0, 20.0));
  BOOST_REQUIRE(sub.ok);
  BOOST_CHECK_EQUAL(service.SubscriptionCount(), 1u);

  prox_api::ProximityUpdate u = service.PollSubscription(sub.id);
  BOOST_REQUIRE(u.current.ok);
  BOOST_CHECK(u.current.entities.empty());
  BOOST_CHECK(u.entered.empty() && u.left.empty());

  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.00005, kStart)).accepted);
  u = service.PollSubscription(sub.id);
  BOOST_REQUIRE_EQUAL(u.current.entities.size(), 1u);
  BOOST_CHECK((u.entered == std::vector<prox::EntityId>{1}));
  BOOST_CHECK(u.left.empty());

  u = service.PollSubscription(sub.id);
  BOOST_CHECK(u.entered.empty() && u.left.empty());

  BOOST_REQUIRE(service.ProcessScan(2, prox::EntityKind::USER, lidar_at(0.0, -0.00005, kStart)).accepted);
  BOOST_REQUIRE(service.RemoveEntity(1).removed);
  u = service.PollSubscription(sub.id);
  BOOST_CHECK((u.entered == std::vector<prox::EntityId>{2}));
  BOOST_CHECK((u.left == std::vector<prox::EntityId>{1}));

  BOOST_CHECK(service.Unsubscribe(sub.id));
  BOOST_CHECK(!service.Unsubscribe(sub.id));
  u = service.PollSubscription(sub.id);
  BOOST_CHECK(!u.current.ok);
  BOOST_REQUIRE(u.current.error.has_value());
  BOOST_CHECK(*u.current.error == prox::QueryErrorKind::INVALID_DATA);
  BOOST_CHECK_EQUAL(service.SubscriptionCount(), 0u);
}

BOOST_AUTO_TEST_CASE(SubscriptionRequestIsValidatedUpFront) {
  prox_api::SubscribeReply r = service.Subscribe(around(0.0, 0.0, 60.0));
  BOOST_CHECK(!r.ok);
  BOOST_REQUIRE(r.error.has_value());
  BOOST_CHECK(*r.error == prox::QueryErrorKind::INVALID_RADIUS);

  r = service.Subscribe(around(0.0, 200.0, 10.0));
  BOOST_CHECK(!r.ok);
  BOOST_REQUIRE(r.error.has_value());
  BOOST_CHECK(*r.error == prox::QueryErrorKind::INVALID_DATA);
  BOOST_CHECK_EQUAL(service.SubscriptionCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ProximityServiceWiringTests)

BOOST_AUTO_TEST_CASE(FullRequestQueueIsBackpressure) {
  prox_api::ServiceOptions o = test_options();
  o.request_threads = 1;
  o.request_queue_capacity = 1;
  auto store = std::make_shared<GatedStore>();
  prox_api::ProximityService service(o, []() { return kStart; }, store);

  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart)).accepted);

  auto entered = store->Entered();
  auto first = service.DetectProximityAsync(around(0.0, 0.0, 10.0));
  entered.wait();  // the only request thread is parked inside the cache

  auto queued = service.DetectProximityAsync(around(0.0, 0.0, 10.0));
  auto rejected_query = service.DetectProximityAsync(around(0.0, 0.0, 10.0));
  auto rejected_scan = service.SubmitScanAsync(2, prox::EntityKind::USER, lidar_at(0.0, 0.0001, kStart));

  const prox_api::ProximityReply rq = rejected_query.get();
  BOOST_CHECK(!rq.ok);
  BOOST_REQUIRE(rq.error.has_value());
  BOOST_CHECK(*rq.error == prox::QueryErrorKind::BACKPRESSURE);

  const prox_api::ScanReply rs = rejected_scan.get();
  BOOST_CHECK(!rs.accepted);
  BOOST_REQUIRE(rs.error.has_value());
  BOOST_CHECK(*rs.error == prox::IngestErrorKind::BACKPRESSURE);

  store->Release();
  BOOST_CHECK(first.get().ok);
  BOOST_CHECK(queued.get().ok);

  const sched::MetricsSnapshot m = service.Metrics();
  BOOST_CHECK_EQUAL(m.Get(sched::Counter::QUERY_BACKPRESSURE), 1u);
  BOOST_CHECK_EQUAL(m.Get(sched::Counter::INGEST_BACKPRESSURE), 1u);
  BOOST_CHECK_EQUAL(service.RequestPoolStats().rejected, 2u);
}

BOOST_AUTO_TEST_CASE(BrokenCacheStoreDegradesToUncached) {
  prox_api::ServiceOptions o = test_options();
  prox_api::ProximityService service(o, []() { return kStart; }, std::make_shared<BrokenStore>());

  for (prox::EntityId id = 1; id <= 5; ++id) {
    const double lon = 0.00002 * static_cast<double>(id);
    BOOST_REQUIRE(service.ProcessScan(id, prox::EntityKind::USER, lidar_at(0.0, lon, kStart)).accepted);
  }

  for (int round = 0; round < 2; ++round) {
    const prox_api::ProximityReply r = service.DetectProximity(around(0.0, 0.0, 20.0));
    BOOST_REQUIRE(r.ok);
    BOOST_CHECK_EQUAL(r.entities.size(), 5u);
  }
  BOOST_CHECK_GT(service.Metrics().Get(sched::Counter::CACHE_ERROR), 0u);
  BOOST_CHECK_EQUAL(service.Metrics().Get(sched::Counter::CACHE_HIT), 0u);
  BOOST_CHECK_EQUAL(service.RunMaintenance(), 0u);
}

BOOST_AUTO_TEST_CASE(CacheBackendNoneRunsUncached) {
  prox_api::ServiceOptions o = test_options();
  o.cache_backend = cfg::CacheBackend::NONE;
  prox_api::ProximityService service(o, []() { return kStart; });

  BOOST_CHECK(!service.Cache()->Enabled());
  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart)).accepted);
  BOOST_CHECK_EQUAL(service.DetectProximity(around(0.0, 0.0, 5.0)).entities.size(), 1u);
}

BOOST_AUTO_TEST_CASE(SqliteBackendServesQueries) {
  prox_api::ServiceOptions o = test_options();
  o.cache_backend = cfg::CacheBackend::SQLITE;
  prox_api::ProximityService service(o, []() { return kStart; });

  BOOST_CHECK(service.Cache()->Enabled());
  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart)).accepted);
  BOOST_CHECK_EQUAL(service.DetectProximity(around(0.0, 0.0, 5.0)).entities.size(), 1u);
  BOOST_CHECK_EQUAL(service.DetectProximity(around(0.0, 0.0, 5.0)).entities.size(), 1u);
  BOOST_CHECK_GT(service.Metrics().Get(sched::Counter::CACHE_HIT), 0u);
}

BOOST_AUTO_TEST_CASE(FlushPushesMetricsToSink) {
  auto sink = std::make_shared<RecordingSink>();
  prox_api::ProximityService service(test_options(), []() { return kStart; }, nullptr, sink);

  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart)).accepted);
  service.Flush();

  std::lock_guard<std::mutex> lock(sink->mu);
  BOOST_CHECK_GT(sink->emits, 0);
  BOOST_CHECK_EQUAL(sink->counters["ingest_accepted"], 1u);
}

BOOST_AUTO_TEST_CASE(PeriodicFlushFollowsInterval) {
  std::atomic<double> now{kStart};
  prox_api::ServiceOptions o = test_options();
  o.metrics_flush_interval_s = 10.0;
  auto sink = std::make_shared<RecordingSink>();
  prox_api::ProximityService service(o, [&now]() { return now.load(); }, nullptr, sink);

  service.RunMaintenance();
  {
    std::lock_guard<std::mutex> lock(sink->mu);
    BOOST_CHECK_EQUAL(sink->emits, 0);
  }
  now = kStart + 10.0;
  service.RunMaintenance();
  std::lock_guard<std::mutex> lock(sink->mu);
  BOOST_CHECK_GT(sink->emits, 0);
}

BOOST_AUTO_TEST_CASE(BackgroundMaintenanceRuns) {
  std::atomic<double> now{kStart};
  prox_api::ServiceOptions o = test_options();
  o.maintenance_interval_s = 0.02;
  prox_api::ProximityService service(o, [&now]() { return now.load(); });

  ingest::EntityAttributes tag;
  tag.has_expiry = true;
  tag.expires_at_s = kStart + 1.0;
  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::TAG, lidar_at(0.0, 0.0, kStart), tag).accepted);
  now = kStart + 2.0;

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (service.Index().Size() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  BOOST_CHECK_EQUAL(service.Index().Size(), 0u);
  service.Shutdown();
}

BOOST_AUTO_TEST_CASE(DamagedCacheRecordFallsBackToIndexScan) {
  auto store = std::make_shared<cache::MemoryCacheStore>(64);
  prox_api::ProximityService service(test_options(), []() { return kStart; }, store);
  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::USER, lidar_at(0.0, 0.0, kStart)).accepted);

  prox::Entity stored;
  BOOST_REQUIRE(service.Index().Lookup(1, stored));
  const idx::CellKey cell = service.Index().CellFor(stored.point.e_m, stored.point.n_m);
  cache::CellResult header;
  header.cell = cell;
  header.cell_version = service.Index().CellVersion(cell);
  cache::CacheRecord rec;
  rec.payload = cache::EncodeCellResult(header);
  for (std::size_t i = 21; i < 25; ++i) rec.payload[i] = static_cast<char>(0xFF);  // member count
  rec.cell_version = header.cell_version;
  rec.expires_at_s = kStart + 60.0;
  store->Set(cache::ProximityCache::Key(cell, "all"), rec);

  for (int round = 0; round < 2; ++round) {
    const prox_api::ProximityReply r = service.DetectProximity(around(0.0, 0.0, 5.0));
    BOOST_REQUIRE_MESSAGE(r.ok, r.reason);
    BOOST_REQUIRE_EQUAL(r.entities.size(), 1u);
    BOOST_CHECK_EQUAL(r.entities[0].id, 1u);
  }
  const sched::MetricsSnapshot m = service.Metrics();
  BOOST_CHECK_EQUAL(m.Get(sched::Counter::CACHE_ERROR), 1u);
  BOOST_CHECK_GT(m.Get(sched::Counter::CACHE_HIT), 0u);
}

BOOST_AUTO_TEST_CASE(SubscriptionLimitIsBackpressure) {
  prox_api::ServiceOptions o = test_options();
  o.max_subscriptions = 1;
  prox_api::ProximityService service(o, []() { return kStart; });

  const prox_api::SubscribeReply first = service.Subscribe(around(0.0, 0.0, 10.0));
  BOOST_REQUIRE(first.ok);
  const prox_api::SubscribeReply second = service.Subscribe(around(0.0, 0.0, 10.0));
  BOOST_CHECK(!second.ok);
  BOOST_REQUIRE(second.error.has_value());
  BOOST_CHECK(*second.error == prox::QueryErrorKind::BACKPRESSURE);

  BOOST_REQUIRE(service.Unsubscribe(first.id));
  BOOST_CHECK(service.Subscribe(around(0.0, 0.0, 10.0)).ok);
}

BOOST_AUTO_TEST_CASE(ConcurrentMaintenanceFlushesOncePerInterval) {
  std::atomic<double> now{kStart};
  prox_api::ServiceOptions o = test_options();
  o.metrics_flush_interval_s = 10.0;
  auto sink = std::make_shared<RecordingSink>();
  prox_api::ProximityService service(o, [&now]() { return now.load(); }, nullptr, sink);

  now = kStart + 10.0;
  std::vector<std::thread> callers;
  for (int t = 0; t < 4; ++t) {
    callers.emplace_back([&service]() {
      for (int i = 0; i < 50; ++i) service.RunMaintenance();
    });
  }
  for (auto& th : callers) th.join();

  std::lock_guard<std::mutex> lock(sink->mu);
  BOOST_CHECK_EQUAL(sink->emits, static_cast<int>(sched::Counter::COUNT));
}

BOOST_AUTO_TEST_CASE(SubMillisecondMaintenanceIntervalStillRuns) {
  std::atomic<double> now{kStart};
  prox_api::ServiceOptions o = test_options();
  o.maintenance_interval_s = 0.0001;
  prox_api::ProximityService service(o, [&now]() { return now.load(); });

  ingest::EntityAttributes tag;
  tag.has_expiry = true;
  tag.expires_at_s = kStart + 1.0;
  BOOST_REQUIRE(service.ProcessScan(1, prox::EntityKind::TAG, lidar_at(0.0, 0.0, kStart), tag).accepted);
  now = kStart + 2.0;

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (service.Index().Size() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  BOOST_CHECK_EQUAL(service.Index().Size(), 0u);
  service.Shutdown();
  BOOST_CHECK_NO_THROW(service.Shutdown());
}

BOOST_AUTO_TEST_SUITE_END()
