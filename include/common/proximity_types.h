#pragma once
/**
 * @file proximity_types.h
 * @brief Core value types shared by ingest, index, query and service layers.
 *
 * Notes:
 * - All angles are WGS84 decimal degrees, distances meters, times UTC seconds.
 * - Entity is a plain value; the Spatial Index owns the authoritative copy.
 */

#include <cstdint>
#include <vector>

namespace prox {

using EntityId = std::uint64_t;
using IdList = std::vector<EntityId>;

enum class EntityKind : std::uint8_t
{
  USER = 0,
  TAG  = 1
};

enum class SourceKind : std::uint8_t
{
  LIDAR    = 0,  // depth-sensor fix, may qualify as authoritative
  GPS      = 1,
  NETWORK  = 2,
  ADVISORY = 3   // stored form of any sample below the precision threshold
};

enum class EntityStatus : std::uint8_t
{
  ACTIVE  = 0,  // visible (default)
  HIDDEN  = 1,  // owner-hidden, never returned by queries
  EXPIRED = 2,
  DELETED = 3
};

enum class Visibility : std::uint8_t
{
  PUBLIC     = 0,
  PRIVATE    = 1,  // owner only
  ELITE_ONLY = 2   // requester status level must be above REGULAR
};

enum class StatusLevel : std::uint8_t
{
  REGULAR = 0,
  ELITE   = 1,
  RARE    = 2
};

struct SpatialSample
{
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
  double altitude_m = 0.0;
  double horizontal_accuracy_m = 0.0;
  double vertical_accuracy_m = 0.0;
  double timestamp_s = 0.0;
  SourceKind source_kind = SourceKind::LIDAR;
  double confidence = 1.0;  // [0..1]
};

// Position in the engine's local tangent plane (east/north/up about the fusion origin).
struct SpatialPoint
{
  double e_m = 0.0;
  double n_m = 0.0;
  double u_m = 0.0;

  // carried through from the sample, never modified by fusion
  double horizontal_accuracy_m = 0.0;
  double vertical_accuracy_m = 0.0;
  double confidence = 1.0;
  SourceKind source_kind = SourceKind::LIDAR;
  double timestamp_s = 0.0;
};

struct Entity
{
  EntityId id = 0;
  EntityKind kind = EntityKind::USER;

  SpatialSample position{};
  SpatialPoint point{};

  double visibility_radius_m = 50.0;
  EntityStatus status = EntityStatus::ACTIVE;
  Visibility visibility = Visibility::PUBLIC;
  StatusLevel status_level = StatusLevel::REGULAR;
  EntityId owner_id = 0;  // 0 = no owner

  double created_at_s = 0.0;
  double last_updated_at_s = 0.0;
  bool has_expiry = false;
  double expires_at_s = 0.0;
};

// Everything that a reader of the index can observe, excluding bookkeeping
// (created_at_s) that legitimately differs between two writes of the same sample.
bool SameObservableState(const Entity& a, const Entity& b);

// False once a tag is past its expiry, a user has not reported within the
// staleness window, or the status is anything but ACTIVE. Such entities are
// logically absent even before the maintenance sweep removes them.
bool IsLive(const Entity& e, double now_s, double user_staleness_s);

// LiDAR-grade: lidar source and horizontal error within the threshold.
bool IsLidarGrade(const SpatialSample& s, double precision_threshold_m);

const char* ToString(EntityKind k);
const char* ToString(SourceKind k);
const char* ToString(EntityStatus s);
const char* ToString(Visibility v);
const char* ToString(StatusLevel l);

} // namespace prox
