#pragma once
/**
 * @file proximity_cache.h
 * @brief Version-stamped read-through cache of per-cell candidate lists.
 *
 * An entry is valid only while its recorded cell version equals the index's
 * current version for that cell and its TTL has not elapsed. Store failures
 * are logged, counted and reported as misses; they never fail a query.
 */

#include "cache/cache_store.h"
#include "cache/cell_result_codec.h"
#include "index/spatial_index.h"
#include "sched/service_metrics.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace cache {

struct CacheConfig {
  bool enabled = true;
  double ttl_s = 5.0;
};

class ProximityCache {
public:
  ProximityCache(const CacheConfig& cfg,
                 std::shared_ptr<ICacheStore> store,
                 const idx::ISpatialIndex& index,
                 sched::ServiceMetrics* metrics = nullptr);

  bool Enabled() const { return cfg_.enabled && store_ != nullptr; }
  const CacheConfig& Config() const { return cfg_; }
  ICacheStore* Store() const { return store_.get(); }

  std::optional<CellResult> Get(const idx::CellKey& cell, const std::string& signature, double now_s);

  // result.cell_version must be the version the members were read at.
  void Put(const std::string& signature, const CellResult& result, double now_s);

  // Drop expired records from the store; 0 on store failure.
  std::size_t Purge(double now_s);

  static std::string Key(const idx::CellKey& cell, const std::string& signature);

private:
  void count(sched::Counter c);
  void on_store_error(const char* op, const std::string& key, const std::exception& ex);

  CacheConfig cfg_;
  std::shared_ptr<ICacheStore> store_;
  const idx::ISpatialIndex& index_;
  sched::ServiceMetrics* metrics_ = nullptr;
};

} // namespace cache
