#include "sim/entity_generator.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sim {
namespace {

constexpr double kPi = 3.14159265358979323846;

prox::SourceKind source_from_text(const std::string& s) {
  if (s == "LIDAR") return prox::SourceKind::LIDAR;
  if (s == "GPS") return prox::SourceKind::GPS;
  if (s == "NETWORK") return prox::SourceKind::NETWORK;
  throw std::runtime_error("EntityGenerator: unknown band source '" + s + "'");
}

// Returns the chosen band, or nullptr when no band has positive weight.
const cfg::AccuracyBand* pick_band(std::mt19937_64& rng,
                                   const std::vector<cfg::AccuracyBand>& bands,
                                   bool lidar_only) {
  // Build normalized CDF (robust to fractions not summing to 1.0)
  double sum = 0.0;
  for (const auto& b : bands) {
    if (lidar_only && b.source != "LIDAR") continue;
    sum += std::max(0.0, b.fraction);
  }
  if (sum <= 0.0) return nullptr;

  std::uniform_real_distribution<double> unif01(0.0, 1.0);
  const double u = unif01(rng) * sum;

  double acc = 0.0;
  const cfg::AccuracyBand* chosen = nullptr;
  for (const auto& b : bands) {
    if (lidar_only && b.source != "LIDAR") continue;
    chosen = &b;
    acc += std::max(0.0, b.fraction);
    if (u <= acc) break;
  }
  return chosen;
}

double reflect(double v, double lim) {
  if (v > lim) return 2.0 * lim - v;
  if (v < -lim) return -2.0 * lim - v;
  return v;
}

} // namespace

EntityGenerator::EntityGenerator(const cfg::DemoScenarioCfg& scenario, const coord::CoordinateFusion& fusion)
    : scenario_(scenario), fusion_(fusion), rng_(scenario.seed) {
  if (scenario_.extent_m <= 0.0) throw std::runtime_error("EntityGenerator: extent_m must be > 0");
  if (scenario_.users < 0 || scenario_.tags < 0) throw std::runtime_error("EntityGenerator: negative population");
  for (const auto& b : scenario_.accuracy_bands) source_from_text(b.source);
}

prox::StatusLevel EntityGenerator::draw_level() {
  std::uniform_real_distribution<double> unif01(0.0, 1.0);
  const double u = unif01(rng_);
  if (u < scenario_.rare_fraction) return prox::StatusLevel::RARE;
  if (u < scenario_.rare_fraction + scenario_.elite_fraction) return prox::StatusLevel::ELITE;
  return prox::StatusLevel::REGULAR;
}

void EntityGenerator::resample(SyntheticEntity& s, double now_s, bool lidar_only) {
  prox::SpatialSample& out = s.sample;
  fusion_.EnuToGeodetic(s.e_m, s.n_m, s.u_m, out.latitude_deg, out.longitude_deg, out.altitude_m);
  out.timestamp_s = now_s;

  const cfg::AccuracyBand* band = pick_band(rng_, scenario_.accuracy_bands, lidar_only);
  if (!band) {
    out.source_kind = prox::SourceKind::LIDAR;
    out.horizontal_accuracy_m = 0.005;
  } else {
    out.source_kind = source_from_text(band->source);
    std::uniform_real_distribution<double> unif(band->min_m, band->max_m);
    out.horizontal_accuracy_m = (band->max_m > band->min_m) ? unif(rng_) : band->min_m;
  }
  out.vertical_accuracy_m = 1.5 * out.horizontal_accuracy_m;

  std::uniform_real_distribution<double> conf(0.7, 1.0);
  out.confidence = (out.source_kind == prox::SourceKind::LIDAR) ? conf(rng_) : 0.5 * conf(rng_);
}

std::vector<SyntheticEntity> EntityGenerator::Populate(double now_s) {
  const double lim = scenario_.extent_m;
  std::uniform_real_distribution<double> ux(-lim, lim);
  std::uniform_real_distribution<double> uh(0.0, 2.0 * kPi);
  std::uniform_real_distribution<double> uz(0.0, 30.0);
  std::uniform_real_distribution<double> unif01(0.0, 1.0);
  std::uniform_real_distribution<double> vis(5.0, 50.0);

  std::vector<SyntheticEntity> out;
  out.reserve(static_cast<std::size_t>(scenario_.users + scenario_.tags));

  for (int i = 0; i < scenario_.users; ++i) {
    SyntheticEntity s;
    s.id = static_cast<prox::EntityId>(i + 1);
    s.kind = prox::EntityKind::USER;
    s.e_m = ux(rng_);
    s.n_m = ux(rng_);
    s.u_m = 1.5;
    s.heading_rad = uh(rng_);
    s.attrs.status_level = draw_level();
    s.attrs.visibility_radius_m = 50.0;
    resample(s, now_s, false);
    out.push_back(s);
  }

  for (int i = 0; i < scenario_.tags; ++i) {
    SyntheticEntity s;
    s.id = static_cast<prox::EntityId>(scenario_.users + i + 1);
    s.kind = prox::EntityKind::TAG;
    s.e_m = ux(rng_);
    s.n_m = ux(rng_);
    s.u_m = uz(rng_);
    s.attrs.status_level = draw_level();
    s.attrs.visibility_radius_m = vis(rng_);
    s.attrs.has_expiry = true;
    s.attrs.expires_at_s = now_s + scenario_.tag_ttl_s;
    if (scenario_.users > 0) {
      std::uniform_int_distribution<int> owner(1, scenario_.users);
      s.attrs.owner_id = static_cast<prox::EntityId>(owner(rng_));
    }
    const double u = unif01(rng_);
    if (u < scenario_.private_fraction) {
      s.attrs.visibility = prox::Visibility::PRIVATE;
    } else if (s.attrs.status_level != prox::StatusLevel::REGULAR && u < 2.0 * scenario_.private_fraction) {
      s.attrs.visibility = prox::Visibility::ELITE_ONLY;
    }
    resample(s, now_s, true);
    out.push_back(s);
  }
  return out;
}

void EntityGenerator::Walk(std::vector<SyntheticEntity>& entities, double dt_s, double now_s) {
  std::normal_distribution<double> turn(0.0, 0.3);
  const double lim = scenario_.extent_m;
  const double step = scenario_.walk_speed_mps * dt_s;

  for (auto& s : entities) {
    if (s.kind != prox::EntityKind::USER) continue;
    s.heading_rad += turn(rng_);
    s.e_m = reflect(s.e_m + step * std::cos(s.heading_rad), lim);
    s.n_m = reflect(s.n_m + step * std::sin(s.heading_rad), lim);
    resample(s, now_s, false);
  }
}

} // namespace sim
