#include "common/proximity_types.h"

namespace prox {

static bool same_sample(const SpatialSample& a, const SpatialSample& b) {
  return a.latitude_deg == b.latitude_deg &&
         a.longitude_deg == b.longitude_deg &&
         a.altitude_m == b.altitude_m &&
         a.horizontal_accuracy_m == b.horizontal_accuracy_m &&
         a.vertical_accuracy_m == b.vertical_accuracy_m &&
         a.timestamp_s == b.timestamp_s &&
         a.source_kind == b.source_kind &&
         a.confidence == b.confidence;
}

bool SameObservableState(const Entity& a, const Entity& b) {
  return a.id == b.id &&
         a.kind == b.kind &&
         same_sample(a.position, b.position) &&
         a.visibility_radius_m == b.visibility_radius_m &&
         a.status == b.status &&
         a.visibility == b.visibility &&
         a.status_level == b.status_level &&
         a.owner_id == b.owner_id &&
         a.last_updated_at_s == b.last_updated_at_s &&
         a.has_expiry == b.has_expiry &&
         (!a.has_expiry || a.expires_at_s == b.expires_at_s);
}

bool IsLive(const Entity& e, double now_s, double user_staleness_s) {
  if (e.status != EntityStatus::ACTIVE) return false;
  if (e.kind == EntityKind::TAG) {
    return !(e.has_expiry && now_s >= e.expires_at_s);
  }
  if (user_staleness_s > 0.0 && (now_s - e.last_updated_at_s) > user_staleness_s) return false;
  return true;
}

bool IsLidarGrade(const SpatialSample& s, double precision_threshold_m) {
  return s.source_kind == SourceKind::LIDAR && s.horizontal_accuracy_m <= precision_threshold_m;
}

const char* ToString(EntityKind k) {
  switch (k) {
    case EntityKind::USER: return "user";
    case EntityKind::TAG:  return "tag";
  }
  return "unknown";
}

const char* ToString(SourceKind k) {
  switch (k) {
    case SourceKind::LIDAR:    return "lidar";
    case SourceKind::GPS:      return "gps";
    case SourceKind::NETWORK:  return "network";
    case SourceKind::ADVISORY: return "advisory";
  }
  return "unknown";
}

const char* ToString(EntityStatus s) {
  switch (s) {
    case EntityStatus::ACTIVE:  return "active";
    case EntityStatus::HIDDEN:  return "hidden";
    case EntityStatus::EXPIRED: return "expired";
    case EntityStatus::DELETED: return "deleted";
  }
  return "unknown";
}

const char* ToString(Visibility v) {
  switch (v) {
    case Visibility::PUBLIC:     return "public";
    case Visibility::PRIVATE:    return "private";
    case Visibility::ELITE_ONLY: return "elite_only";
  }
  return "unknown";
}

const char* ToString(StatusLevel l) {
  switch (l) {
    case StatusLevel::REGULAR: return "regular";
    case StatusLevel::ELITE:   return "elite";
    case StatusLevel::RARE:    return "rare";
  }
  return "unknown";
}

} // namespace prox
