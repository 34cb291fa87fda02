#include "common/coordinate_utilities/coordinate_fusion.h"

#include <cmath>
#include <stdexcept>

namespace coord {
namespace {

constexpr double kPi = 3.14159265358979323846;

inline double deg2rad(double d) { return d * kPi / 180.0; }
inline double rad2deg(double r) { return r * 180.0 / kPi; }

// ENU basis at a geodetic latitude/longitude (geodetic normal, not geocentric).
Eigen::Matrix3d enu_basis(double lat_rad, double lon_rad) {
  const double sl = std::sin(lat_rad);
  const double cl = std::cos(lat_rad);
  const double so = std::sin(lon_rad);
  const double co = std::cos(lon_rad);

  Eigen::Matrix3d R;
  R << -so,       co,      0.0,
       -sl * co, -sl * so, cl,
        cl * co,  cl * so, sl;
  return R;
}

} // namespace

void GeodeticToEcef(double lat_deg, double lon_deg, double alt_m,
                    double& x_ecef, double& y_ecef, double& z_ecef) {
  const double lat = deg2rad(lat_deg);
  const double lon = deg2rad(lon_deg);
  const double sl = std::sin(lat);
  const double cl = std::cos(lat);
  const double N = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sl * sl);

  x_ecef = (N + alt_m) * cl * std::cos(lon);
  y_ecef = (N + alt_m) * cl * std::sin(lon);
  z_ecef = (N * (1.0 - kWgs84E2) + alt_m) * sl;
}

void EcefToGeodetic(double x_ecef, double y_ecef, double z_ecef,
                    double& lat_deg, double& lon_deg, double& alt_m) {
  const double p = std::sqrt(x_ecef * x_ecef + y_ecef * y_ecef);
  const double lon = std::atan2(y_ecef, x_ecef);

  double lat = std::atan2(z_ecef, p * (1.0 - kWgs84E2));
  double h = 0.0;
  for (int it = 0; it < 6; ++it) {
    const double sl = std::sin(lat);
    const double N = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sl * sl);
    const double cl = std::cos(lat);
    if (std::abs(cl) > 1e-12) {
      h = p / cl - N;
    } else {
      h = std::abs(z_ecef) - N * (1.0 - kWgs84E2);
    }
    lat = std::atan2(z_ecef, p * (1.0 - kWgs84E2 * N / (N + h)));
  }

  lat_deg = rad2deg(lat);
  lon_deg = rad2deg(lon);
  alt_m = h;
}

double HaversineMeters(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) {
  const double dlat = deg2rad(lat2_deg - lat1_deg);
  const double dlon = deg2rad(lon2_deg - lon1_deg);
  const double a = std::sin(dlat / 2.0) * std::sin(dlat / 2.0) +
                   std::cos(deg2rad(lat1_deg)) * std::cos(deg2rad(lat2_deg)) *
                   std::sin(dlon / 2.0) * std::sin(dlon / 2.0);
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadiusM * c;
}

CoordinateFusion::CoordinateFusion(const FusionOrigin& origin) : origin_(origin) {
  if (!(origin_.lat_deg >= -90.0 && origin_.lat_deg <= 90.0) ||
      !(origin_.lon_deg >= -180.0 && origin_.lon_deg <= 180.0) ||
      !std::isfinite(origin_.alt_m)) {
    throw std::runtime_error("CoordinateFusion: origin out of range");
  }
  double x = 0.0, y = 0.0, z = 0.0;
  GeodeticToEcef(origin_.lat_deg, origin_.lon_deg, origin_.alt_m, x, y, z);
  origin_ecef_ = Eigen::Vector3d(x, y, z);
  ecef_to_enu_ = enu_basis(deg2rad(origin_.lat_deg), deg2rad(origin_.lon_deg));
}

void CoordinateFusion::GeodeticToEnu(double lat_deg, double lon_deg, double alt_m,
                                     double& e_m, double& n_m, double& u_m) const {
  double x = 0.0, y = 0.0, z = 0.0;
  GeodeticToEcef(lat_deg, lon_deg, alt_m, x, y, z);
  const Eigen::Vector3d enu = ecef_to_enu_ * (Eigen::Vector3d(x, y, z) - origin_ecef_);
  e_m = enu.x();
  n_m = enu.y();
  u_m = enu.z();
}

void CoordinateFusion::EnuToGeodetic(double e_m, double n_m, double u_m,
                                     double& lat_deg, double& lon_deg, double& alt_m) const {
  // Basis is orthonormal, so the inverse is the transpose.
  const Eigen::Vector3d ecef = origin_ecef_ + ecef_to_enu_.transpose() * Eigen::Vector3d(e_m, n_m, u_m);
  EcefToGeodetic(ecef.x(), ecef.y(), ecef.z(), lat_deg, lon_deg, alt_m);
}

prox::SpatialPoint CoordinateFusion::Fuse(const prox::SpatialSample& sample) const {
  prox::SpatialPoint p;
  GeodeticToEnu(sample.latitude_deg, sample.longitude_deg, sample.altitude_m, p.e_m, p.n_m, p.u_m);
  p.horizontal_accuracy_m = sample.horizontal_accuracy_m;
  p.vertical_accuracy_m = sample.vertical_accuracy_m;
  p.confidence = sample.confidence;
  p.source_kind = sample.source_kind;
  p.timestamp_s = sample.timestamp_s;
  return p;
}

double CoordinateFusion::Distance(const prox::SpatialPoint& a, const prox::SpatialPoint& b) {
  const double de = a.e_m - b.e_m;
  const double dn = a.n_m - b.n_m;
  const double du = a.u_m - b.u_m;
  return std::sqrt(de * de + dn * dn + du * du);
}

} // namespace coord
