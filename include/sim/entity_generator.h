#pragma once
/**
 * @file entity_generator.h
 * @brief Deterministic synthetic users/tags for the demo driver and stress tests.
 *
 * Notes:
 *  - Positions are drawn uniformly in a square of +/- extent_m around the
 *    fusion origin (ENU), then converted back to WGS84 for submission.
 *  - Accuracy and source kind come from the scenario's band mixture.
 *  - Tags draw only from LIDAR bands; bands coarser than the precision
 *    threshold produce tags the ingest pipeline will reject.
 */

#include "common/coordinate_utilities/coordinate_fusion.h"
#include "common/proximity_types.h"
#include "config/config_types.h"
#include "ingest/ingest_pipeline.h"

#include <cstddef>
#include <random>
#include <vector>

namespace sim {

struct SyntheticEntity {
  prox::EntityId id = 0;
  prox::EntityKind kind = prox::EntityKind::USER;
  double e_m = 0.0;
  double n_m = 0.0;
  double u_m = 0.0;
  double heading_rad = 0.0;
  prox::SpatialSample sample{};
  ingest::EntityAttributes attrs{};
};

class EntityGenerator {
public:
  EntityGenerator(const cfg::DemoScenarioCfg& scenario, const coord::CoordinateFusion& fusion);

  // Users get ids [1, users], tags [users + 1, users + tags].
  std::vector<SyntheticEntity> Populate(double now_s);

  // Random-walk every user by walk_speed * dt (reflecting at the extent) and
  // resample its accuracy; tags do not move.
  void Walk(std::vector<SyntheticEntity>& entities, double dt_s, double now_s);

  const cfg::DemoScenarioCfg& Scenario() const { return scenario_; }

private:
  void resample(SyntheticEntity& s, double now_s, bool lidar_only);
  prox::StatusLevel draw_level();

  cfg::DemoScenarioCfg scenario_;
  const coord::CoordinateFusion& fusion_;
  std::mt19937_64 rng_;
};

} // namespace sim
