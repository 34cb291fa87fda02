#include "cache/memory_cache_store.h"

namespace cache {

MemoryCacheStore::MemoryCacheStore(std::size_t max_entries) : max_entries_(max_entries) {
  if (max_entries_ == 0) throw std::runtime_error("MemoryCacheStore: max_entries must be > 0");
}

bool MemoryCacheStore::Get(const std::string& key, CacheRecord& out) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(key);
  if (it == map_.end()) return false;
  lru_.splice(lru_.begin(), lru_, it->second.lru_it);
  out = it->second.rec;
  return true;
}

void MemoryCacheStore::Set(const std::string& key, const CacheRecord& rec) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(key);
  if (it != map_.end()) {
    it->second.rec = rec;
    lru_.splice(lru_.begin(), lru_, it->second.lru_it);
    return;
  }

  while (map_.size() >= max_entries_ && !lru_.empty()) {
    map_.erase(lru_.back());
    lru_.pop_back();
    ++evictions_;
  }

  lru_.push_front(key);
  map_.emplace(key, Slot{rec, lru_.begin()});
}

void MemoryCacheStore::Erase(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(key);
  if (it == map_.end()) return;
  lru_.erase(it->second.lru_it);
  map_.erase(it);
}

std::size_t MemoryCacheStore::Purge(double now_s) {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t removed = 0;
  for (auto it = map_.begin(); it != map_.end();) {
    if (it->second.rec.expires_at_s <= now_s) {
      lru_.erase(it->second.lru_it);
      it = map_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t MemoryCacheStore::Size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.size();
}

std::size_t MemoryCacheStore::Evictions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return evictions_;
}

} // namespace cache
