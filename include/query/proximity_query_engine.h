#pragma once
/**
 * @file proximity_query_engine.h
 * @brief Radius queries over the Spatial Index with cache read-through.
 *
 * Per query:
 *  1) validate radius and center
 *  2) fuse the center, ask the index for every cell the circle touches
 *  3) per cell: cached candidate list, or a cell snapshot (then cached)
 *  4) exact Euclidean distance in the fusion frame + visibility rules
 *  5) sort (distance, id), classify scan quality, truncate
 *
 * The time budget is checked before each cell. Running out returns what was
 * gathered so far with degraded = true.
 */

#include "cache/proximity_cache.h"
#include "common/coordinate_utilities/coordinate_fusion.h"
#include "common/proximity_types.h"
#include "common/result.h"
#include "index/spatial_index.h"
#include "query/proximity_filter.h"
#include "sched/service_metrics.h"
#include "sched/worker_pool.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace query {

enum class ScanQuality : std::uint8_t {
  LOW    = 0,
  MEDIUM = 1,
  HIGH   = 2,
  ULTRA  = 3
};

const char* ToString(ScanQuality q);

// Minimum LiDAR-grade fraction for each level.
struct QualityThresholds {
  double ultra = 0.9;
  double high = 0.6;
  double medium = 0.3;
};

struct QueryConfig {
  double min_radius_m = 0.5;
  double max_radius_m = 50.0;
  std::size_t default_max_results = 100;
  std::size_t max_results_cap = 100;
  double default_budget_ms = 100.0;
  double user_staleness_s = 300.0;  // <= 0 disables the staleness rule
  QualityThresholds quality{};

  // Candidate counts above this are evaluated in chunks on the CPU pool.
  std::size_t parallel_threshold = 4096;
  std::size_t parallel_chunk = 1024;
};

struct RequesterContext {
  prox::EntityId requester_id = 0;  // 0 = anonymous
  prox::StatusLevel status_level = prox::StatusLevel::REGULAR;
  bool exclude_self = true;
};

struct QueryRequest {
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
  double altitude_m = 0.0;
  double radius_m = 10.0;
  FilterSet filters{};
  std::size_t max_results = 0;   // 0 = QueryConfig::default_max_results
  RequesterContext requester{};
  double budget_ms = -1.0;       // < 0 = QueryConfig::default_budget_ms
};

struct ProximityHit {
  prox::EntityId id = 0;
  prox::EntityKind kind = prox::EntityKind::USER;
  double distance_m = 0.0;
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
  double altitude_m = 0.0;
  double horizontal_accuracy_m = 0.0;
  prox::SourceKind source_kind = prox::SourceKind::LIDAR;
  prox::StatusLevel status_level = prox::StatusLevel::REGULAR;
  double visibility_radius_m = 0.0;
};

struct ProximityResult {
  std::vector<ProximityHit> hits;
  ScanQuality scan_quality = ScanQuality::LOW;
  bool degraded = false;

  // diagnostics
  std::size_t cells_total = 0;
  std::size_t cells_scanned = 0;
  std::size_t cache_hits = 0;
  std::size_t candidates = 0;
  std::size_t qualifying = 0;  // before truncation
};

using QueryResult = prox::Result<ProximityResult, prox::QueryError>;

class ProximityQueryEngine {
public:
  // cache and cpu_pool are optional.
  ProximityQueryEngine(const QueryConfig& cfg,
                       const coord::CoordinateFusion& fusion,
                       const idx::ISpatialIndex& index,
                       cache::ProximityCache* cache = nullptr,
                       sched::WorkerPool* cpu_pool = nullptr,
                       sched::ServiceMetrics* metrics = nullptr);

  const QueryConfig& Config() const { return cfg_; }

  QueryResult Query(const QueryRequest& req, double now_s) const;

  static ScanQuality ClassifyQuality(std::size_t lidar_grade, std::size_t total,
                                     const QualityThresholds& t);

private:
  struct Center {
    double e = 0.0;
    double n = 0.0;
    double u = 0.0;
  };

  std::vector<prox::Entity> cell_candidates(const idx::CellKey& key,
                                            const FilterSet& filters,
                                            const std::string& signature,
                                            double now_s,
                                            bool& cache_hit) const;

  void evaluate(const std::vector<prox::Entity>& cands,
                std::size_t begin, std::size_t end,
                const Center& c, const QueryRequest& req, double now_s,
                std::vector<ProximityHit>& out) const;

  std::vector<ProximityHit> evaluate_all(const std::vector<prox::Entity>& cands,
                                         const Center& c, const QueryRequest& req,
                                         double now_s) const;

  QueryResult reject(prox::QueryErrorKind kind, const std::string& reason) const;

  QueryConfig cfg_;
  const coord::CoordinateFusion& fusion_;
  const idx::ISpatialIndex& index_;
  cache::ProximityCache* cache_ = nullptr;
  sched::WorkerPool* cpu_pool_ = nullptr;
  sched::ServiceMetrics* metrics_ = nullptr;
};

} // namespace query
