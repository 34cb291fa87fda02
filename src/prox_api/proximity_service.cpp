#include "prox_api/proximity_service.h"

#include "cache/memory_cache_store.h"
#include "cache/sqlite_cache_store.h"
#include "common/log.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace prox_api {
namespace {

ScanReply to_reply(const ingest::IngestResult& r) {
  ScanReply out;
  if (r.ok()) {
    out.accepted = true;
    out.ack = r.value();
    return out;
  }
  out.error = r.error().kind;
  out.reason = r.error().reason;
  return out;
}

ScanReply backpressure_scan(const std::string& reason) {
  ScanReply out;
  out.error = prox::IngestErrorKind::BACKPRESSURE;
  out.reason = reason;
  return out;
}

ProximityUpdate unknown_subscription(SubscriptionId id) {
  ProximityUpdate out;
  out.current.error = prox::QueryErrorKind::INVALID_DATA;
  out.current.reason = "unknown subscription " + std::to_string(id);
  return out;
}

template <typename T>
std::future<T> ready_future(T value) {
  std::promise<T> p;
  p.set_value(std::move(value));
  return p.get_future();
}

} // namespace

double SystemClockSeconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

ServiceOptions ServiceOptions::FromConfig(const cfg::ConfigBundle& b) {
  ServiceOptions o;
  o.origin.lat_deg = b.engine.origin.lat_deg;
  o.origin.lon_deg = b.engine.origin.lon_deg;
  o.origin.alt_m = b.engine.origin.alt_m;
  o.cell_size_m = b.engine.cell_size_m;

  o.ingest.precision_threshold_m = b.engine.ingest.precision_threshold_m;
  o.ingest.min_altitude_m = b.engine.ingest.min_altitude_m;
  o.ingest.max_altitude_m = b.engine.ingest.max_altitude_m;
  o.ingest.max_accuracy_m = b.engine.ingest.max_accuracy_m;
  o.ingest.tags_require_precision = b.engine.ingest.tags_require_precision;
  o.ingest.min_visibility_radius_m = b.engine.query.min_radius_m;
  o.ingest.max_visibility_radius_m = b.engine.query.max_radius_m;

  o.query.min_radius_m = b.engine.query.min_radius_m;
  o.query.max_radius_m = b.engine.query.max_radius_m;
  o.query.default_max_results = static_cast<std::size_t>(b.engine.query.default_max_results);
  o.query.max_results_cap = static_cast<std::size_t>(b.engine.query.max_results_cap);
  o.query.user_staleness_s = b.engine.query.user_staleness_s;
  o.query.quality.ultra = b.engine.quality.ultra_min_fraction;
  o.query.quality.high = b.engine.quality.high_min_fraction;
  o.query.quality.medium = b.engine.quality.medium_min_fraction;
  o.query.default_budget_ms = b.runtime.time_budget_ms;
  o.query.parallel_threshold = static_cast<std::size_t>(b.runtime.parallel_threshold);
  o.query.parallel_chunk = static_cast<std::size_t>(b.runtime.parallel_chunk);

  o.cache_backend = b.cache_profile.backend;
  o.cache.enabled = b.cache_profile.backend != cfg::CacheBackend::NONE;
  o.cache.ttl_s = b.cache_profile.ttl_s;
  o.cache_max_entries = static_cast<std::size_t>(b.cache_profile.max_entries);
  o.cache_db_uri = b.cache_profile.db_uri;
  o.cache_busy_timeout_ms = b.cache_profile.busy_timeout_ms;

  o.request_threads = static_cast<std::size_t>(b.runtime.request_threads);
  o.request_queue_capacity = static_cast<std::size_t>(b.runtime.request_queue_capacity);
  o.worker_threads = static_cast<std::size_t>(b.runtime.worker_threads);
  o.worker_queue_capacity = static_cast<std::size_t>(b.runtime.worker_queue_capacity);
  o.maintenance_interval_s = b.runtime.maintenance_interval_s;

  if (b.has_performance) o.metrics_flush_interval_s = b.performance.diagnostics.metrics_flush_interval_s;
  return o;
}

std::shared_ptr<cache::ICacheStore> ProximityService::make_store() const {
  switch (opts_.cache_backend) {
    case cfg::CacheBackend::MEMORY:
      return std::make_shared<cache::MemoryCacheStore>(opts_.cache_max_entries);
    case cfg::CacheBackend::SQLITE:
      try {
        return std::make_shared<cache::SqliteCacheStore>(opts_.cache_db_uri, opts_.cache_busy_timeout_ms);
      } catch (const cache::CacheError& ex) {
        if (logu::should_log(logu::LogLevel::WARN)) {
          std::cerr << "WARNING: cache store unavailable, running uncached: " << ex.what() << "\n";
        }
        return nullptr;
      }
    case cfg::CacheBackend::NONE:
      return nullptr;
  }
  return nullptr;
}

ProximityService::ProximityService(const ServiceOptions& opts,
                                   Clock clock,
                                   std::shared_ptr<cache::ICacheStore> store,
                                   std::shared_ptr<sched::IMetricsSink> sink)
    : opts_(opts),
      clock_(clock ? std::move(clock) : Clock(&SystemClockSeconds)),
      sink_(std::move(sink)),
      fusion_(opts.origin) {
  index_ = std::make_unique<idx::UniformGridIndex>(opts_.cell_size_m);

  if (!store) store = make_store();
  cache::CacheConfig cc = opts_.cache;
  if (!store) cc.enabled = false;
  cache_ = std::make_unique<cache::ProximityCache>(cc, std::move(store), *index_, &metrics_);

  cpu_pool_ = std::make_unique<sched::WorkerPool>("cpu", opts_.worker_threads, opts_.worker_queue_capacity);
  pipeline_ = std::make_unique<ingest::IngestPipeline>(opts_.ingest, fusion_, *index_, &metrics_);
  engine_ = std::make_unique<query::ProximityQueryEngine>(opts_.query, fusion_, *index_,
                                                          cache_.get(), cpu_pool_.get(), &metrics_);
  request_pool_ = std::make_unique<sched::WorkerPool>("request", opts_.request_threads, opts_.request_queue_capacity);

  last_flush_s_ = clock_();
  if (opts_.maintenance_interval_s > 0.0) {
    maint_thread_ = std::thread(&ProximityService::MaintenanceLoop, this);
  }
}

ProximityService::~ProximityService() {
  Shutdown();
}

void ProximityService::Shutdown() {
  std::lock_guard<std::mutex> guard(shutdown_mu_);
  if (shut_down_) return;
  shut_down_ = true;

  {
    std::lock_guard<std::mutex> lock(maint_mu_);
    maint_stop_ = true;
  }
  maint_cv_.notify_all();
  if (maint_thread_.joinable()) maint_thread_.join();

  // Requests may still submit CPU chunks, so the request pool goes first.
  request_pool_->Shutdown();
  cpu_pool_->Shutdown();
}

ScanReply ProximityService::ProcessScan(prox::EntityId id,
                                        prox::EntityKind kind,
                                        const prox::SpatialSample& sample,
                                        const ingest::EntityAttributes& attrs) {
  sched::ScopedTimer timer(&metrics_, sched::Timer::INGEST);
  try {
    return to_reply(pipeline_->Submit(id, kind, sample, attrs));
  } catch (const std::exception& ex) {
    if (logu::should_log(logu::LogLevel::ERROR)) {
      std::cerr << "ERROR: ProcessScan(" << id << ") failed: " << ex.what() << "\n";
    }
    ScanReply out;
    out.error = prox::IngestErrorKind::INVALID_DATA;
    out.reason = std::string("internal error: ") + ex.what();
    return out;
  }
}

ScanReply ProximityService::UpdateLocation(prox::EntityId id, const prox::SpatialSample& sample) {
  sched::ScopedTimer timer(&metrics_, sched::Timer::INGEST);
  try {
    return to_reply(pipeline_->UpdateLocation(id, sample));
  } catch (const std::exception& ex) {
    if (logu::should_log(logu::LogLevel::ERROR)) {
      std::cerr << "ERROR: UpdateLocation(" << id << ") failed: " << ex.what() << "\n";
    }
    ScanReply out;
    out.error = prox::IngestErrorKind::INVALID_DATA;
    out.reason = std::string("internal error: ") + ex.what();
    return out;
  }
}

ProximityReply ProximityService::DetectProximity(const query::QueryRequest& request) {
  ProximityReply out;
  try {
    const query::QueryResult r = engine_->Query(request, clock_());
    if (!r.ok()) {
      out.error = r.error().kind;
      out.reason = r.error().reason;
      return out;
    }
    const query::ProximityResult& res = r.value();
    out.ok = true;
    out.entities = res.hits;
    out.scan_quality = res.scan_quality;
    out.degraded = res.degraded;
    return out;
  } catch (const std::exception& ex) {
    if (logu::should_log(logu::LogLevel::ERROR)) {
      std::cerr << "ERROR: DetectProximity failed: " << ex.what() << "\n";
    }
    out.ok = false;
    out.error = prox::QueryErrorKind::INVALID_DATA;
    out.reason = std::string("internal error: ") + ex.what();
    return out;
  }
}

RemoveReply ProximityService::RemoveEntity(prox::EntityId id) {
  RemoveReply out;
  try {
    const auto r = pipeline_->Remove(id);
    if (r.ok()) {
      out.removed = r.value();
    } else {
      out.error = r.error().kind;
      out.reason = r.error().reason;
    }
  } catch (const std::exception& ex) {
    if (logu::should_log(logu::LogLevel::ERROR)) {
      std::cerr << "ERROR: RemoveEntity(" << id << ") failed: " << ex.what() << "\n";
    }
    out.error = prox::IngestErrorKind::INVALID_DATA;
    out.reason = std::string("internal error: ") + ex.what();
  }
  return out;
}

std::vector<ScanReply> ProximityService::ProcessScans(const std::vector<ScanRequest>& scans) {
  std::vector<ScanReply> out;
  out.reserve(scans.size());
  for (const auto& s : scans) {
    out.push_back(ProcessScan(s.id, s.kind, s.sample, s.attrs));
  }
  return out;
}

InteractionReply ProximityService::CheckInteraction(const prox::SpatialSample& a, const prox::SpatialSample& b) {
  InteractionReply out;
  try {
    for (const prox::SpatialSample* s : {&a, &b}) {
      if (auto err = pipeline_->ValidateSample(*s)) {
        out.error = prox::QueryErrorKind::INVALID_DATA;
        out.reason = *err;
        return out;
      }
    }

    const prox::SpatialPoint pa = fusion_.Fuse(a);
    const prox::SpatialPoint pb = fusion_.Fuse(b);
    const double d = coord::CoordinateFusion::Distance(pa, pb);
    out.ok = true;
    out.distance_m = d;
    if (d < opts_.interaction_min_distance_m || d > opts_.query.max_radius_m) return out;

    const double now = clock_();
    for (const auto& key : index_->CellsWithinRadius(pa.e_m, pa.n_m, d)) {
      for (const auto& e : index_->EntitiesIn(key)) {
        if (e.position.source_kind != prox::SourceKind::LIDAR) continue;
        if (!prox::IsLive(e, now, opts_.query.user_staleness_s)) continue;
        if (coord::CoordinateFusion::Distance(pa, e.point) > d) continue;
        if (coord::CoordinateFusion::Distance(pb, e.point) > d) continue;
        out.confidence = std::max(out.confidence, e.point.confidence);
      }
    }
    out.possible = out.confidence >= opts_.interaction_min_confidence;
  } catch (const std::exception& ex) {
    if (logu::should_log(logu::LogLevel::ERROR)) {
      std::cerr << "ERROR: CheckInteraction failed: " << ex.what() << "\n";
    }
    out = InteractionReply{};
    out.error = prox::QueryErrorKind::INVALID_DATA;
    out.reason = std::string("internal error: ") + ex.what();
  }
  return out;
}

SubscribeReply ProximityService::Subscribe(const query::QueryRequest& request) {
  SubscribeReply out;
  const query::QueryConfig& q = opts_.query;
  if (!std::isfinite(request.radius_m) || request.radius_m < q.min_radius_m || request.radius_m > q.max_radius_m) {
    std::ostringstream oss;
    oss << "radius " << request.radius_m << " m outside [" << q.min_radius_m << ", " << q.max_radius_m << "]";
    out.error = prox::QueryErrorKind::INVALID_RADIUS;
    out.reason = oss.str();
    return out;
  }
  if (!std::isfinite(request.latitude_deg) || std::abs(request.latitude_deg) > 90.0 ||
      !std::isfinite(request.longitude_deg) || std::abs(request.longitude_deg) > 180.0 ||
      !std::isfinite(request.altitude_m)) {
    out.error = prox::QueryErrorKind::INVALID_DATA;
    out.reason = "invalid subscription center";
    return out;
  }

  std::lock_guard<std::mutex> lock(subs_mu_);
  if (subs_.size() >= opts_.max_subscriptions) {
    out.error = prox::QueryErrorKind::BACKPRESSURE;
    out.reason = "subscription limit reached";
    return out;
  }
  out.ok = true;
  out.id = next_sub_id_++;
  subs_[out.id] = Subscription{request, {}};
  return out;
}

ProximityUpdate ProximityService::PollSubscription(SubscriptionId id) {
  query::QueryRequest request;
  {
    std::lock_guard<std::mutex> lock(subs_mu_);
    auto it = subs_.find(id);
    if (it == subs_.end()) return unknown_subscription(id);
    request = it->second.request;
  }

  ProximityUpdate out;
  out.current = DetectProximity(request);
  if (!out.current.ok) return out;

  std::set<prox::EntityId> seen;
  for (const auto& h : out.current.entities) seen.insert(h.id);

  std::lock_guard<std::mutex> lock(subs_mu_);
  auto it = subs_.find(id);
  if (it == subs_.end()) return unknown_subscription(id);

  std::set<prox::EntityId>& last = it->second.last;
  std::set_difference(seen.begin(), seen.end(), last.begin(), last.end(), std::back_inserter(out.entered));
  if (out.current.degraded) {
    // A partial scan cannot prove that anything left.
    last.insert(seen.begin(), seen.end());
  } else {
    std::set_difference(last.begin(), last.end(), seen.begin(), seen.end(), std::back_inserter(out.left));
    last.swap(seen);
  }
  return out;
}

bool ProximityService::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(subs_mu_);
  return subs_.erase(id) != 0;
}

std::size_t ProximityService::SubscriptionCount() const {
  std::lock_guard<std::mutex> lock(subs_mu_);
  return subs_.size();
}

std::future<ScanReply> ProximityService::SubmitScanAsync(prox::EntityId id,
                                                         prox::EntityKind kind,
                                                         const prox::SpatialSample& sample,
                                                         const ingest::EntityAttributes& attrs) {
  auto fut = request_pool_->TrySubmit([this, id, kind, sample, attrs]() {
    return ProcessScan(id, kind, sample, attrs);
  });
  if (fut) return std::move(*fut);

  metrics_.Increment(sched::Counter::INGEST_BACKPRESSURE);
  return ready_future(backpressure_scan("request queue full"));
}

std::future<ProximityReply> ProximityService::DetectProximityAsync(const query::QueryRequest& request) {
  auto fut = request_pool_->TrySubmit([this, request]() {
    return DetectProximity(request);
  });
  if (fut) return std::move(*fut);

  metrics_.Increment(sched::Counter::QUERY_BACKPRESSURE);
  ProximityReply out;
  out.error = prox::QueryErrorKind::BACKPRESSURE;
  out.reason = "request queue full";
  return ready_future(std::move(out));
}

std::size_t ProximityService::RunMaintenance() {
  const double now = clock_();
  std::size_t purged = 0;
  try {
    purged = pipeline_->PurgeExpired(now, opts_.query.user_staleness_s);
    cache_->Purge(now);
    metrics_.SetCellContention(index_->ContentionCount());

    if (flush_due(now)) metrics_.EmitTo(sink_.get());
  } catch (const std::exception& ex) {
    if (logu::should_log(logu::LogLevel::ERROR)) {
      std::cerr << "ERROR: maintenance pass failed: " << ex.what() << "\n";
    }
  }

  if (purged && logu::should_log(logu::LogLevel::DEBUG)) {
    std::cerr << "DEBUG: maintenance purged " << purged << " entities\n";
  }
  return purged;
}

bool ProximityService::flush_due(double now_s) {
  if (!sink_ || !(opts_.metrics_flush_interval_s > 0.0)) return false;
  std::lock_guard<std::mutex> lock(flush_mu_);
  if (now_s - last_flush_s_ < opts_.metrics_flush_interval_s) return false;
  last_flush_s_ = now_s;
  return true;
}

void ProximityService::MaintenanceLoop() {
  const auto interval = std::max(std::chrono::milliseconds(1),
                                 std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::duration<double>(opts_.maintenance_interval_s)));

  std::unique_lock<std::mutex> lock(maint_mu_);
  while (!maint_stop_) {
    maint_cv_.wait_for(lock, interval, [&]() { return maint_stop_; });
    if (maint_stop_) break;

    lock.unlock();
    RunMaintenance();
    lock.lock();
  }
}

void ProximityService::Flush() {
  request_pool_->Drain();
  cpu_pool_->Drain();
  metrics_.SetCellContention(index_->ContentionCount());
  if (sink_) metrics_.EmitTo(sink_.get());
}

sched::MetricsSnapshot ProximityService::Metrics() const {
  sched::MetricsSnapshot s = metrics_.Snapshot();
  s.cell_contention = index_->ContentionCount();
  return s;
}

} // namespace prox_api
