#pragma once
/**
 * @file cell_result_codec.h
 * @brief Binary encoding of per-cell candidate lists for cache stores.
 *
 * Layout, every field little-endian whatever the host order (doubles as
 * their IEEE-754 bit pattern):
 *   u32 magic 'PXCR' | u8 format version | i32 ix | i32 iy | u64 cell version
 *   | u32 count | count * entity record
 *
 * Decode never trusts the payload: short reads, bad magic, unknown format
 * versions, member counts the payload cannot hold and out-of-range enum
 * values all throw CacheError.
 */

#include "common/proximity_types.h"
#include "index/cell_key.h"

#include <cstdint>
#include <string>
#include <vector>

namespace cache {

// Statically filtered members of one cell, as of cell_version.
struct CellResult {
  idx::CellKey cell{};
  std::uint64_t cell_version = 0;
  std::vector<prox::Entity> members;
};

constexpr std::uint32_t kCellResultMagic = 0x52435850u;  // "PXCR"
constexpr std::uint8_t kCellResultFormat = 1;

std::string EncodeCellResult(const CellResult& r);
CellResult DecodeCellResult(const std::string& payload);

} // namespace cache
