#pragma once
/**
 * @file coordinate_fusion.h
 * @brief WGS84 geodetic samples -> local tangent plane (ENU) about a fixed origin.
 *
 * The ENU frame is a rigid rotation + translation of ECEF, so Euclidean
 * distance between two fused points equals their ECEF chord distance. This is
 * what lets the index and query engine use plain Euclidean math.
 *
 * Fusion only reprojects: accuracies, confidence and source kind are copied
 * through untouched.
 */

#include "common/proximity_types.h"

#include <Eigen/Dense>

namespace coord {

// WGS84 ellipsoid
constexpr double kWgs84A = 6378137.0;
constexpr double kWgs84F = 1.0 / 298.257223563;
constexpr double kWgs84E2 = kWgs84F * (2.0 - kWgs84F);

// Mean earth radius used by HaversineMeters.
constexpr double kEarthRadiusM = 6371000.0;

struct FusionOrigin {
  double lat_deg = 0.0;
  double lon_deg = 0.0;
  double alt_m = 0.0;
  double epoch_s = 0.0;  // when this origin was established
};

void GeodeticToEcef(double lat_deg, double lon_deg, double alt_m,
                    double& x_ecef, double& y_ecef, double& z_ecef);

// Bowring-style iteration; accurate to well below a millimeter near the surface.
void EcefToGeodetic(double x_ecef, double y_ecef, double z_ecef,
                    double& lat_deg, double& lon_deg, double& alt_m);

double HaversineMeters(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg);

class CoordinateFusion {
public:
  explicit CoordinateFusion(const FusionOrigin& origin = FusionOrigin{});

  const FusionOrigin& Origin() const { return origin_; }

  prox::SpatialPoint Fuse(const prox::SpatialSample& sample) const;

  void GeodeticToEnu(double lat_deg, double lon_deg, double alt_m,
                     double& e_m, double& n_m, double& u_m) const;

  void EnuToGeodetic(double e_m, double n_m, double u_m,
                     double& lat_deg, double& lon_deg, double& alt_m) const;

  static double Distance(const prox::SpatialPoint& a, const prox::SpatialPoint& b);

private:
  FusionOrigin origin_;
  Eigen::Vector3d origin_ecef_;
  Eigen::Matrix3d ecef_to_enu_;  // rows: east, north, up
};

} // namespace coord
