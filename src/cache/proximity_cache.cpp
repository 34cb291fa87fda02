#include "cache/proximity_cache.h"

#include "common/log.h"

#include <iostream>
#include <stdexcept>

namespace cache {

ProximityCache::ProximityCache(const CacheConfig& cfg,
                               std::shared_ptr<ICacheStore> store,
                               const idx::ISpatialIndex& index,
                               sched::ServiceMetrics* metrics)
    : cfg_(cfg), store_(std::move(store)), index_(index), metrics_(metrics) {
  if (!(cfg_.ttl_s > 0.0)) throw std::runtime_error("ProximityCache: ttl_s must be > 0");
}

std::string ProximityCache::Key(const idx::CellKey& cell, const std::string& signature) {
  return idx::ToString(cell) + "|" + signature;
}

void ProximityCache::count(sched::Counter c) {
  if (metrics_) metrics_->Increment(c);
}

void ProximityCache::on_store_error(const char* op, const std::string& key, const std::exception& ex) {
  count(sched::Counter::CACHE_ERROR);
  if (logu::should_log(logu::LogLevel::WARN)) {
    std::cerr << "WARNING: cache " << op << " failed (store=" << store_->Name()
              << ", key=" << key << "): " << ex.what() << "\n";
  }
}

std::optional<CellResult> ProximityCache::Get(const idx::CellKey& cell,
                                              const std::string& signature,
                                              double now_s) {
  if (!Enabled()) return std::nullopt;

  const std::string key = Key(cell, signature);
  CacheRecord rec;
  try {
    if (!store_->Get(key, rec)) {
      count(sched::Counter::CACHE_MISS);
      return std::nullopt;
    }
  } catch (const CacheError& ex) {
    on_store_error("get", key, ex);
    count(sched::Counter::CACHE_MISS);
    return std::nullopt;
  }

  const bool fresh = now_s < rec.expires_at_s;
  const bool current = rec.cell_version == index_.CellVersion(cell);
  if (!fresh || !current) {
    try {
      store_->Erase(key);
    } catch (const CacheError& ex) {
      on_store_error("erase", key, ex);
    }
    count(sched::Counter::CACHE_MISS);
    return std::nullopt;
  }

  try {
    CellResult out = DecodeCellResult(rec.payload);
    if (out.cell != cell || out.cell_version != rec.cell_version) {
      throw CacheError("payload header does not match record");
    }
    count(sched::Counter::CACHE_HIT);
    return out;
  } catch (const CacheError& ex) {
    on_store_error("decode", key, ex);
  }

  // Damaged record: drop it so the next query repopulates the cell.
  try {
    store_->Erase(key);
  } catch (const CacheError& ex) {
    on_store_error("erase", key, ex);
  }
  count(sched::Counter::CACHE_MISS);
  return std::nullopt;
}

void ProximityCache::Put(const std::string& signature, const CellResult& result, double now_s) {
  if (!Enabled()) return;

  const std::string key = Key(result.cell, signature);
  CacheRecord rec;
  rec.payload = EncodeCellResult(result);
  rec.cell_version = result.cell_version;
  rec.expires_at_s = now_s + cfg_.ttl_s;
  try {
    store_->Set(key, rec);
  } catch (const CacheError& ex) {
    on_store_error("set", key, ex);
  }
}

std::size_t ProximityCache::Purge(double now_s) {
  if (!store_) return 0;
  try {
    return store_->Purge(now_s);
  } catch (const CacheError& ex) {
    on_store_error("purge", "*", ex);
    return 0;
  }
}

} // namespace cache
