#define BOOST_TEST_MODULE CoordinateFusionTests
#include <boost/test/unit_test.hpp>

#include "common/coordinate_utilities/coordinate_fusion.h"

#include <cmath>
#include <stdexcept>

namespace {

coord::FusionOrigin sf_origin() {
  coord::FusionOrigin o;
  o.lat_deg = 37.7749;
  o.lon_deg = -122.4194;
  o.alt_m = 10.0;
  return o;
}

} // namespace

BOOST_AUTO_TEST_SUITE(CoordinateFusionTests)

BOOST_AUTO_TEST_CASE(OriginMapsToZero) {
  const coord::CoordinateFusion fusion(sf_origin());
  double e = 1.0, n = 1.0, u = 1.0;
  fusion.GeodeticToEnu(37.7749, -122.4194, 10.0, e, n, u);
  BOOST_CHECK_SMALL(e, 1e-6);
  BOOST_CHECK_SMALL(n, 1e-6);
  BOOST_CHECK_SMALL(u, 1e-6);
}

BOOST_AUTO_TEST_CASE(EnuAxesPointEastNorthUp) {
  const coord::CoordinateFusion fusion;  // origin at 0,0,0

  double e = 0.0, n = 0.0, u = 0.0;
  fusion.GeodeticToEnu(0.0, 0.0001, 0.0, e, n, u);
  BOOST_CHECK_GT(e, 11.0);
  BOOST_CHECK_SMALL(n, 1e-6);

  fusion.GeodeticToEnu(0.0001, 0.0, 0.0, e, n, u);
  BOOST_CHECK_GT(n, 11.0);
  BOOST_CHECK_SMALL(e, 1e-6);

  fusion.GeodeticToEnu(0.0, 0.0, 25.0, e, n, u);
  BOOST_CHECK_CLOSE(u, 25.0, 1e-6);
}

BOOST_AUTO_TEST_CASE(RoundTripIsSubMillimeter) {
  const coord::CoordinateFusion fusion(sf_origin());
  const double pts[][3] = {{40.0, 12.5, 3.0}, {-35.0, -80.0, 0.0}, {0.0, 0.0, 100.0}, {150.0, -60.0, 20.0}};

  for (const auto& p : pts) {
    double lat = 0.0, lon = 0.0, alt = 0.0;
    fusion.EnuToGeodetic(p[0], p[1], p[2], lat, lon, alt);
    double e = 0.0, n = 0.0, u = 0.0;
    fusion.GeodeticToEnu(lat, lon, alt, e, n, u);
    BOOST_CHECK_SMALL(e - p[0], 1e-3);
    BOOST_CHECK_SMALL(n - p[1], 1e-3);
    BOOST_CHECK_SMALL(u - p[2], 1e-3);
  }
}

BOOST_AUTO_TEST_CASE(ShortRangeDistanceMatchesHaversine) {
  const coord::CoordinateFusion fusion;

  prox::SpatialSample a;
  prox::SpatialSample b;
  b.longitude_deg = 0.00015;

  const double d = coord::CoordinateFusion::Distance(fusion.Fuse(a), fusion.Fuse(b));
  const double h = coord::HaversineMeters(0.0, 0.0, 0.0, 0.00015);

  BOOST_CHECK_CLOSE(d, 16.7, 0.5);
  BOOST_CHECK_SMALL(d - h, 0.05);
}

BOOST_AUTO_TEST_CASE(FuseCarriesAccuracyThrough) {
  const coord::CoordinateFusion fusion(sf_origin());

  prox::SpatialSample s;
  s.latitude_deg = 37.775;
  s.longitude_deg = -122.419;
  s.altitude_m = 12.0;
  s.horizontal_accuracy_m = 0.004;
  s.vertical_accuracy_m = 0.006;
  s.confidence = 0.8;
  s.source_kind = prox::SourceKind::GPS;
  s.timestamp_s = 1234.5;

  const prox::SpatialPoint p = fusion.Fuse(s);
  BOOST_CHECK_EQUAL(p.horizontal_accuracy_m, 0.004);
  BOOST_CHECK_EQUAL(p.vertical_accuracy_m, 0.006);
  BOOST_CHECK_EQUAL(p.confidence, 0.8);
  BOOST_CHECK(p.source_kind == prox::SourceKind::GPS);
  BOOST_CHECK_EQUAL(p.timestamp_s, 1234.5);
}

BOOST_AUTO_TEST_CASE(RejectsOutOfRangeOrigin) {
  coord::FusionOrigin o;
  o.lat_deg = 91.0;
  BOOST_CHECK_THROW(coord::CoordinateFusion{o}, std::runtime_error);

  o.lat_deg = 0.0;
  o.lon_deg = -181.0;
  BOOST_CHECK_THROW(coord::CoordinateFusion{o}, std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
