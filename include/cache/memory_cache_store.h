#pragma once

#include "cache/cache_store.h"

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cache {

// In-process store with a bounded entry count (least recently used is evicted).
class MemoryCacheStore final : public ICacheStore {
public:
  explicit MemoryCacheStore(std::size_t max_entries = 65536);

  bool Get(const std::string& key, CacheRecord& out) override;
  void Set(const std::string& key, const CacheRecord& rec) override;
  void Erase(const std::string& key) override;
  std::size_t Purge(double now_s) override;
  std::size_t Size() const override;
  const char* Name() const override { return "memory"; }

  std::size_t Evictions() const;

private:
  struct Slot {
    CacheRecord rec;
    std::list<std::string>::iterator lru_it;
  };

  std::size_t max_entries_ = 0;

  mutable std::mutex mu_;
  std::list<std::string> lru_;  // front = most recent
  std::unordered_map<std::string, Slot> map_;
  std::size_t evictions_ = 0;
};

} // namespace cache
