#pragma once
/**
 * @file ingest_pipeline.h
 * @brief Validation and routing of position/scan updates into the Spatial Index.
 *
 * Flow per submission:
 *   validate -> precision policy -> sequencer lock -> fuse -> index upsert
 *
 * Cache invalidation is implicit: the upsert bumps cell versions and cached
 * entries are checked against those versions on read.
 */

#include "common/coordinate_utilities/coordinate_fusion.h"
#include "common/proximity_types.h"
#include "common/result.h"
#include "index/spatial_index.h"
#include "ingest/update_sequencer.h"
#include "sched/service_metrics.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ingest {

struct IngestConfig {
  double precision_threshold_m = 0.01;  // 1 cm at the 10 m reference distance
  double min_altitude_m = -100.0;
  double max_altitude_m = 10000.0;
  double max_accuracy_m = 50.0;
  double min_visibility_radius_m = 0.5;
  double max_visibility_radius_m = 50.0;
  bool tags_require_precision = true;   // tag creation must be LiDAR-grade
  std::size_t sequencer_stripes = 256;
};

// Caller-supplied entity attributes (tag-lifecycle / account collaborators).
struct EntityAttributes {
  double visibility_radius_m = 50.0;
  prox::EntityStatus status = prox::EntityStatus::ACTIVE;
  prox::Visibility visibility = prox::Visibility::PUBLIC;
  prox::StatusLevel status_level = prox::StatusLevel::REGULAR;
  prox::EntityId owner_id = 0;
  bool has_expiry = false;
  double expires_at_s = 0.0;
  bool require_precision = false;  // fine-proximity writes
};

enum class AckKind : std::uint8_t {
  ACCEPTED          = 0,
  ACCEPTED_ADVISORY = 1,  // stored, but excluded from precision-sensitive queries
  DUPLICATE         = 2   // identical resubmission, no-op
};

const char* ToString(AckKind k);

using IngestResult = prox::Result<AckKind, prox::IngestError>;

class IngestPipeline {
public:
  IngestPipeline(const IngestConfig& cfg,
                 const coord::CoordinateFusion& fusion,
                 idx::ISpatialIndex& index,
                 sched::ServiceMetrics* metrics = nullptr);

  const IngestConfig& Config() const { return cfg_; }

  IngestResult Submit(prox::EntityId id,
                      prox::EntityKind kind,
                      const prox::SpatialSample& sample,
                      const EntityAttributes& attrs = EntityAttributes{});

  // Position-only update; keeps stored attributes, creates a USER when unknown.
  IngestResult UpdateLocation(prox::EntityId id, const prox::SpatialSample& sample);

  // Explicit deletion; ok(false) when the entity was not indexed.
  prox::Result<bool, prox::IngestError> Remove(prox::EntityId id);

  // Physically drop expired tags, stale users and EXPIRED/DELETED entities.
  std::size_t PurgeExpired(double now_s, double user_staleness_s);

  std::optional<std::string> ValidateSample(const prox::SpatialSample& s) const;

private:
  std::optional<std::string> validate_attributes(const EntityAttributes& a) const;

  IngestResult apply_locked(prox::EntityId id,
                            prox::EntityKind kind,
                            const prox::SpatialSample& sample,
                            const EntityAttributes& attrs,
                            bool require_precision,
                            const prox::Entity* existing);

  IngestResult reject(prox::IngestErrorKind kind, const std::string& reason);
  void count(sched::Counter c);

  IngestConfig cfg_;
  const coord::CoordinateFusion& fusion_;
  idx::ISpatialIndex& index_;
  sched::ServiceMetrics* metrics_ = nullptr;
  UpdateSequencer sequencer_;
};

EntityAttributes AttributesOf(const prox::Entity& e);

} // namespace ingest
