#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cache {

// Raised by stores on any backend failure. Never crosses ProximityCache.
class CacheError : public std::runtime_error {
public:
  explicit CacheError(const std::string& what) : std::runtime_error(what) {}
};

struct CacheRecord {
  std::string payload;              // encoded CellResult
  std::uint64_t cell_version = 0;   // index version the payload was built from
  double expires_at_s = 0.0;
};

// Key/value store with expiry metadata (GET / SET / TTL semantics).
// Implementations must be thread-safe and throw CacheError on failure.
class ICacheStore {
public:
  virtual ~ICacheStore() = default;

  virtual bool Get(const std::string& key, CacheRecord& out) = 0;
  virtual void Set(const std::string& key, const CacheRecord& rec) = 0;
  virtual void Erase(const std::string& key) = 0;

  // Drop every record with expires_at_s <= now_s; returns the number removed.
  virtual std::size_t Purge(double now_s) = 0;

  virtual std::size_t Size() const = 0;
  virtual const char* Name() const = 0;
};

} // namespace cache
