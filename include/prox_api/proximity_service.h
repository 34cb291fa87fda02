#pragma once
/**
 * @file proximity_service.h
 * @brief Service facade: ProcessScan / UpdateLocation / DetectProximity / RemoveEntity,
 *        plus batch ingest, pairwise interaction checks and polled subscriptions.
 *
 * Ownership:
 *  - The service owns the index, fusion frame, pipeline, query engine, cache,
 *    both worker pools, metrics and the maintenance thread.
 *  - The Spatial Index is the only shared mutable state; everything else is
 *    either immutable after construction or internally synchronized.
 *
 * Error policy:
 *  - No exception crosses this API. Every call returns an explicit reply.
 *  - Async variants return a ready future carrying a backpressure reply when
 *    the request executor is full.
 */

#include "cache/cache_store.h"
#include "cache/proximity_cache.h"
#include "common/coordinate_utilities/coordinate_fusion.h"
#include "common/proximity_types.h"
#include "common/result.h"
#include "config/config_types.h"
#include "index/uniform_grid_index.h"
#include "ingest/ingest_pipeline.h"
#include "query/proximity_query_engine.h"
#include "sched/metrics_sink.h"
#include "sched/service_metrics.h"
#include "sched/worker_pool.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace prox_api {

// Wall clock in UTC seconds. Injectable so tests control expiry and staleness.
using Clock = std::function<double()>;

double SystemClockSeconds();

struct ServiceOptions {
  coord::FusionOrigin origin{};
  double cell_size_m = 50.0;

  ingest::IngestConfig ingest{};
  query::QueryConfig query{};

  cfg::CacheBackend cache_backend = cfg::CacheBackend::MEMORY;
  cache::CacheConfig cache{};
  std::size_t cache_max_entries = 65536;
  std::string cache_db_uri;      // SQLITE; empty = in-memory
  int cache_busy_timeout_ms = 50;

  std::size_t request_threads = 4;
  std::size_t request_queue_capacity = 1024;
  std::size_t worker_threads = 2;
  std::size_t worker_queue_capacity = 256;

  double maintenance_interval_s = 1.0;   // <= 0 disables the maintenance thread
  double metrics_flush_interval_s = 0.0; // <= 0 disables periodic sink emission

  // CheckInteraction: pairs closer than this are treated as co-located.
  double interaction_min_distance_m = 0.5;
  // CheckInteraction: LiDAR support needed between the pair.
  double interaction_min_confidence = 0.7;

  std::size_t max_subscriptions = 1024;

  static ServiceOptions FromConfig(const cfg::ConfigBundle& bundle);
};

struct ScanReply {
  bool accepted = false;
  ingest::AckKind ack = ingest::AckKind::ACCEPTED;
  std::optional<prox::IngestErrorKind> error;
  std::string reason;
};

struct ProximityReply {
  bool ok = false;
  std::optional<prox::QueryErrorKind> error;
  std::string reason;
  std::vector<query::ProximityHit> entities;
  query::ScanQuality scan_quality = query::ScanQuality::LOW;
  bool degraded = false;
};

struct RemoveReply {
  bool removed = false;
  std::optional<prox::IngestErrorKind> error;
  std::string reason;
};

// One element of a ProcessScans batch.
struct ScanRequest {
  prox::EntityId id = 0;
  prox::EntityKind kind = prox::EntityKind::USER;
  prox::SpatialSample sample{};
  ingest::EntityAttributes attrs{};
};

struct InteractionReply {
  bool ok = false;
  std::optional<prox::QueryErrorKind> error;
  std::string reason;
  bool possible = false;
  double distance_m = 0.0;
  double confidence = 0.0;  // best supporting LiDAR fix, 0 when none
};

using SubscriptionId = std::uint64_t;

struct SubscribeReply {
  bool ok = false;
  SubscriptionId id = 0;
  std::optional<prox::QueryErrorKind> error;
  std::string reason;
};

// One poll of a standing proximity request.
// entered / left are ascending ids relative to the previous poll.
struct ProximityUpdate {
  ProximityReply current;
  std::vector<prox::EntityId> entered;
  std::vector<prox::EntityId> left;
};

class ProximityService {
public:
  // store: overrides the store built from opts (tests inject failing stores).
  // sink: optional telemetry collaborator.
  explicit ProximityService(const ServiceOptions& opts,
                            Clock clock = Clock{},
                            std::shared_ptr<cache::ICacheStore> store = nullptr,
                            std::shared_ptr<sched::IMetricsSink> sink = nullptr);
  ~ProximityService();

  ProximityService(const ProximityService&) = delete;
  ProximityService& operator=(const ProximityService&) = delete;

  ScanReply ProcessScan(prox::EntityId id,
                        prox::EntityKind kind,
                        const prox::SpatialSample& sample,
                        const ingest::EntityAttributes& attrs = ingest::EntityAttributes{});

  ScanReply UpdateLocation(prox::EntityId id, const prox::SpatialSample& sample);

  ProximityReply DetectProximity(const query::QueryRequest& request);

  RemoveReply RemoveEntity(prox::EntityId id);

  // Applies each scan in order through the same pipeline; one reply per element.
  std::vector<ScanReply> ProcessScans(const std::vector<ScanRequest>& scans);

  // Whether two positions can interact: far enough apart to be distinct,
  // within the maximum query radius, and backed by a live LiDAR-grade fix
  // lying within their separation of both ends.
  InteractionReply CheckInteraction(const prox::SpatialSample& a, const prox::SpatialSample& b);

  // Standing proximity request. Each PollSubscription re-runs it and reports
  // the full result plus the ids that entered or left since the last poll.
  SubscribeReply Subscribe(const query::QueryRequest& request);
  ProximityUpdate PollSubscription(SubscriptionId id);
  bool Unsubscribe(SubscriptionId id);
  std::size_t SubscriptionCount() const;

  std::future<ScanReply> SubmitScanAsync(prox::EntityId id,
                                         prox::EntityKind kind,
                                         const prox::SpatialSample& sample,
                                         const ingest::EntityAttributes& attrs = ingest::EntityAttributes{});

  std::future<ProximityReply> DetectProximityAsync(const query::QueryRequest& request);

  // One maintenance pass (purge, cache purge, contention, optional sink flush).
  // Returns the number of entities purged.
  std::size_t RunMaintenance();

  // Wait for queued requests, then push metrics to the sink.
  void Flush();

  // Stop maintenance, drain and join both pools. Idempotent.
  void Shutdown();

  sched::MetricsSnapshot Metrics() const;

  double Now() const { return clock_(); }
  const ServiceOptions& Options() const { return opts_; }
  idx::ISpatialIndex& Index() { return *index_; }
  const coord::CoordinateFusion& Fusion() const { return fusion_; }
  cache::ProximityCache* Cache() { return cache_.get(); }
  sched::PoolStats RequestPoolStats() const { return request_pool_->GetStats(); }

private:
  struct Subscription {
    query::QueryRequest request;
    std::set<prox::EntityId> last;
  };

  void MaintenanceLoop();
  bool flush_due(double now_s);
  std::shared_ptr<cache::ICacheStore> make_store() const;

  ServiceOptions opts_;
  Clock clock_;

  sched::ServiceMetrics metrics_;
  std::shared_ptr<sched::IMetricsSink> sink_;

  coord::CoordinateFusion fusion_;
  std::unique_ptr<idx::UniformGridIndex> index_;
  std::unique_ptr<cache::ProximityCache> cache_;
  std::unique_ptr<sched::WorkerPool> cpu_pool_;
  std::unique_ptr<ingest::IngestPipeline> pipeline_;
  std::unique_ptr<query::ProximityQueryEngine> engine_;
  std::unique_ptr<sched::WorkerPool> request_pool_;

  // Maintenance thread
  std::mutex maint_mu_;
  std::condition_variable maint_cv_;
  bool maint_stop_ = false;
  std::thread maint_thread_;

  std::mutex flush_mu_;
  double last_flush_s_ = 0.0;

  mutable std::mutex subs_mu_;
  std::map<SubscriptionId, Subscription> subs_;
  SubscriptionId next_sub_id_ = 1;

  std::mutex shutdown_mu_;
  bool shut_down_ = false;
};

} // namespace prox_api
