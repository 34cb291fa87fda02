#include "query/proximity_query_engine.h"

#include "common/log.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace query {
namespace {

bool visible_to(const prox::Entity& e, const RequesterContext& who) {
  if (who.exclude_self && who.requester_id != 0 && e.id == who.requester_id) return false;
  switch (e.visibility) {
    case prox::Visibility::PUBLIC:
      return true;
    case prox::Visibility::PRIVATE:
      return e.owner_id != 0 && e.owner_id == who.requester_id;
    case prox::Visibility::ELITE_ONLY:
      return who.status_level != prox::StatusLevel::REGULAR;
  }
  return false;
}

} // namespace

const char* ToString(ScanQuality q) {
  switch (q) {
    case ScanQuality::LOW:    return "LOW";
    case ScanQuality::MEDIUM: return "MEDIUM";
    case ScanQuality::HIGH:   return "HIGH";
    case ScanQuality::ULTRA:  return "ULTRA";
  }
  return "UNKNOWN";
}

ProximityQueryEngine::ProximityQueryEngine(const QueryConfig& cfg,
                                           const coord::CoordinateFusion& fusion,
                                           const idx::ISpatialIndex& index,
                                           cache::ProximityCache* cache,
                                           sched::WorkerPool* cpu_pool,
                                           sched::ServiceMetrics* metrics)
    : cfg_(cfg), fusion_(fusion), index_(index), cache_(cache), cpu_pool_(cpu_pool), metrics_(metrics) {
  if (!(cfg_.min_radius_m > 0.0) || !(cfg_.min_radius_m <= cfg_.max_radius_m)) {
    throw std::runtime_error("ProximityQueryEngine: invalid radius range");
  }
  if (cfg_.max_results_cap == 0) throw std::runtime_error("ProximityQueryEngine: max_results_cap must be > 0");
  if (cfg_.default_max_results == 0 || cfg_.default_max_results > cfg_.max_results_cap) {
    cfg_.default_max_results = cfg_.max_results_cap;
  }
  if (cfg_.parallel_chunk == 0) cfg_.parallel_chunk = 1024;
}

ScanQuality ProximityQueryEngine::ClassifyQuality(std::size_t lidar_grade, std::size_t total,
                                                  const QualityThresholds& t) {
  if (total == 0) return ScanQuality::LOW;
  const double f = static_cast<double>(lidar_grade) / static_cast<double>(total);
  if (f >= t.ultra) return ScanQuality::ULTRA;
  if (f >= t.high) return ScanQuality::HIGH;
  if (f >= t.medium) return ScanQuality::MEDIUM;
  return ScanQuality::LOW;
}

QueryResult ProximityQueryEngine::reject(prox::QueryErrorKind kind, const std::string& reason) const {
  if (metrics_) metrics_->Increment(sched::Counter::QUERY_REJECTED);
  return QueryResult::Fail(prox::QueryError{kind, reason});
}

std::vector<prox::Entity> ProximityQueryEngine::cell_candidates(const idx::CellKey& key,
                                                                const FilterSet& filters,
                                                                const std::string& signature,
                                                                double now_s,
                                                                bool& cache_hit) const {
  cache_hit = false;
  if (cache_) {
    if (auto cached = cache_->Get(key, signature, now_s)) {
      cache_hit = true;
      return std::move(cached->members);
    }
  }

  idx::CellView view = index_.EntitiesIn(key);

  cache::CellResult fresh;
  fresh.cell = key;
  fresh.cell_version = view.version;
  fresh.members.reserve(view.size());
  for (const auto& e : view) {
    if (e.status != prox::EntityStatus::ACTIVE) continue;
    if (!filters.Matches(e)) continue;
    fresh.members.push_back(e);
  }

  if (cache_) cache_->Put(signature, fresh, now_s);
  return std::move(fresh.members);
}

void ProximityQueryEngine::evaluate(const std::vector<prox::Entity>& cands,
                                    std::size_t begin, std::size_t end,
                                    const Center& c, const QueryRequest& req, double now_s,
                                    std::vector<ProximityHit>& out) const {
  for (std::size_t i = begin; i < end; ++i) {
    const prox::Entity& e = cands[i];

    const double de = e.point.e_m - c.e;
    const double dn = e.point.n_m - c.n;
    const double du = e.point.u_m - c.u;
    const double d = std::sqrt(de * de + dn * dn + du * du);

    if (d > req.radius_m) continue;
    if (e.visibility_radius_m < d) continue;
    if (!prox::IsLive(e, now_s, cfg_.user_staleness_s)) continue;
    if (!visible_to(e, req.requester)) continue;

    ProximityHit h;
    h.id = e.id;
    h.kind = e.kind;
    h.distance_m = d;
    h.latitude_deg = e.position.latitude_deg;
    h.longitude_deg = e.position.longitude_deg;
    h.altitude_m = e.position.altitude_m;
    h.horizontal_accuracy_m = e.position.horizontal_accuracy_m;
    h.source_kind = e.position.source_kind;
    h.status_level = e.status_level;
    h.visibility_radius_m = e.visibility_radius_m;
    out.push_back(h);
  }
}

std::vector<ProximityHit> ProximityQueryEngine::evaluate_all(const std::vector<prox::Entity>& cands,
                                                             const Center& c, const QueryRequest& req,
                                                             double now_s) const {
  std::vector<ProximityHit> hits;
  if (!cpu_pool_ || cands.size() <= cfg_.parallel_threshold) {
    evaluate(cands, 0, cands.size(), c, req, now_s, hits);
    return hits;
  }

  const std::size_t chunk = cfg_.parallel_chunk;
  std::vector<std::future<std::vector<ProximityHit>>> pending;
  std::vector<std::pair<std::size_t, std::size_t>> inline_ranges;

  for (std::size_t b = 0; b < cands.size(); b += chunk) {
    const std::size_t e = std::min(cands.size(), b + chunk);
    auto fut = cpu_pool_->TrySubmit([this, &cands, b, e, &c, &req, now_s]() {
      std::vector<ProximityHit> part;
      evaluate(cands, b, e, c, req, now_s, part);
      return part;
    });
    if (fut) {
      pending.push_back(std::move(*fut));
    } else {
      inline_ranges.emplace_back(b, e);  // pool saturated
    }
  }

  for (const auto& r : inline_ranges) evaluate(cands, r.first, r.second, c, req, now_s, hits);

  // Chunks reference locals: every future must settle before any get() can throw.
  for (auto& f : pending) f.wait();
  for (auto& f : pending) {
    auto part = f.get();
    hits.insert(hits.end(), part.begin(), part.end());
  }
  return hits;
}

QueryResult ProximityQueryEngine::Query(const QueryRequest& req, double now_s) const {
  sched::ScopedTimer timer(metrics_, sched::Timer::QUERY);
  if (metrics_) metrics_->Increment(sched::Counter::QUERIES);

  if (!std::isfinite(req.radius_m) || req.radius_m < cfg_.min_radius_m || req.radius_m > cfg_.max_radius_m) {
    std::ostringstream oss;
    oss << "radius " << req.radius_m << " m outside [" << cfg_.min_radius_m << ", " << cfg_.max_radius_m << "]";
    return reject(prox::QueryErrorKind::INVALID_RADIUS, oss.str());
  }
  if (!std::isfinite(req.latitude_deg) || std::abs(req.latitude_deg) > 90.0 ||
      !std::isfinite(req.longitude_deg) || std::abs(req.longitude_deg) > 180.0 ||
      !std::isfinite(req.altitude_m)) {
    std::ostringstream oss;
    oss << "invalid query center (" << req.latitude_deg << ", " << req.longitude_deg << ", " << req.altitude_m << ")";
    return reject(prox::QueryErrorKind::INVALID_DATA, oss.str());
  }

  std::size_t max_results = req.max_results ? req.max_results : cfg_.default_max_results;
  max_results = std::min(max_results, cfg_.max_results_cap);

  const double budget_ms = (req.budget_ms >= 0.0) ? req.budget_ms : cfg_.default_budget_ms;
  const auto t0 = std::chrono::steady_clock::now();
  const auto deadline = t0 + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                 std::chrono::duration<double, std::milli>(budget_ms));

  Center c;
  fusion_.GeodeticToEnu(req.latitude_deg, req.longitude_deg, req.altitude_m, c.e, c.n, c.u);

  ProximityResult out;
  const std::vector<idx::CellKey> cells = index_.CellsWithinRadius(c.e, c.n, req.radius_m);
  out.cells_total = cells.size();

  const std::string signature = req.filters.Signature();
  std::vector<prox::Entity> cands;

  for (const auto& key : cells) {
    if (std::chrono::steady_clock::now() >= deadline) {
      out.degraded = true;
      break;
    }
    bool hit = false;
    auto members = cell_candidates(key, req.filters, signature, now_s, hit);
    if (hit) ++out.cache_hits;
    ++out.cells_scanned;
    cands.insert(cands.end(), members.begin(), members.end());
  }
  out.candidates = cands.size();

  out.hits = evaluate_all(cands, c, req, now_s);
  std::sort(out.hits.begin(), out.hits.end(), [](const ProximityHit& a, const ProximityHit& b) {
    if (a.distance_m != b.distance_m) return a.distance_m < b.distance_m;
    return a.id < b.id;
  });

  out.qualifying = out.hits.size();
  const auto n_lidar = static_cast<std::size_t>(std::count_if(
      out.hits.begin(), out.hits.end(),
      [](const ProximityHit& h) { return h.source_kind == prox::SourceKind::LIDAR; }));
  out.scan_quality = ClassifyQuality(n_lidar, out.qualifying, cfg_.quality);

  if (out.hits.size() > max_results) out.hits.resize(max_results);

  if (out.degraded) {
    if (metrics_) metrics_->Increment(sched::Counter::QUERY_DEGRADED);
    if (logu::should_log(logu::LogLevel::WARN)) {
      const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
      std::cerr << "WARNING: proximity query timed out after " << ms << " ms (budget " << budget_ms
                << " ms), scanned " << out.cells_scanned << "/" << out.cells_total << " cells\n";
    }
  }

  return QueryResult::Ok(std::move(out));
}

} // namespace query
