#pragma once

#include "cache/cache_store.h"

#include <cstddef>
#include <mutex>
#include <string>

namespace cache {

// SQLite-backed store standing in for an external key/value cache.
// db_uri empty or ":memory:" keeps everything in process; a file path creates
// parent directories and runs in WAL mode. The file is disposable.
class SqliteCacheStore final : public ICacheStore {
public:
  explicit SqliteCacheStore(const std::string& db_uri = ":memory:", int busy_timeout_ms = 50);
  ~SqliteCacheStore() override;

  SqliteCacheStore(const SqliteCacheStore&) = delete;
  SqliteCacheStore& operator=(const SqliteCacheStore&) = delete;

  bool Get(const std::string& key, CacheRecord& out) override;
  void Set(const std::string& key, const CacheRecord& rec) override;
  void Erase(const std::string& key) override;
  std::size_t Purge(double now_s) override;
  std::size_t Size() const override;
  const char* Name() const override { return "sqlite"; }

private:
  struct Impl;
  static void close_impl(Impl* p);

  Impl* p_;
  mutable std::mutex mu_;
};

} // namespace cache
