#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace idx {

// Integer cell coordinates on the east/north plane of the fusion frame.
// Ordering (ix, then iy) is the global lock order for multi-cell mutation.
struct CellKey {
  std::int32_t ix = 0;
  std::int32_t iy = 0;

  bool operator==(const CellKey& o) const noexcept { return ix == o.ix && iy == o.iy; }
  bool operator!=(const CellKey& o) const noexcept { return !(*this == o); }
  bool operator<(const CellKey& o) const noexcept {
    return (ix != o.ix) ? (ix < o.ix) : (iy < o.iy);
  }
};

struct CellKeyHash {
  std::size_t operator()(const CellKey& k) const noexcept {
    std::uint64_t x = static_cast<std::uint32_t>(k.ix);
    std::uint64_t y = static_cast<std::uint32_t>(k.iy);
    std::uint64_t h = x * 0x9E3779B185EBCA87ULL;
    h ^= y + 0xC2B2AE3D27D4EB4FULL + (h << 6) + (h >> 2);
    return static_cast<std::size_t>(h);
  }
};

// Axis-aligned cell footprint in meters (east/north).
struct CellBounds {
  double min_e = 0.0;
  double max_e = 0.0;
  double min_n = 0.0;
  double max_n = 0.0;
};

// Stable text id, e.g. "c:12:-3"; used in cache keys and logs.
inline std::string ToString(const CellKey& k) {
  return "c:" + std::to_string(k.ix) + ":" + std::to_string(k.iy);
}

} // namespace idx
