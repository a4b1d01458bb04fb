#include "telmodel/geodesy.h"

#include <cmath>

namespace telmodel {

static constexpr int kMaxIterations = 20;
static constexpr double kLatTolerance = 1e-12;  // rad

GeodeticPosition ecefToGeodetic(const Xyz& r_ecef_m) {
  const double x = r_ecef_m.x();
  const double y = r_ecef_m.y();
  const double z = r_ecef_m.z();
  const double p = std::hypot(x, y);

  GeodeticPosition pos;
  pos.lon_deg = rad2deg(std::atan2(y, x));

  if (p == 0.0) {
    // On the polar axis
    const double b = kWgs84A * (1.0 - kWgs84F);
    pos.lat_deg = z >= 0.0 ? 90.0 : -90.0;
    pos.height_m = std::abs(z) - b;
    return pos;
  }

  // Fixed-point iteration on latitude, started from the spherical guess.
  double lat = std::atan2(z, p * (1.0 - kWgs84E2));
  double n = kWgs84A;
  double h = 0.0;
  for (int i = 0; i < kMaxIterations; ++i) {
    const double sin_lat = std::sin(lat);
    n = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sin_lat * sin_lat);
    h = p / std::cos(lat) - n;
    const double next = std::atan2(z, p * (1.0 - kWgs84E2 * n / (n + h)));
    const double delta = std::abs(next - lat);
    lat = next;
    if (delta < kLatTolerance) {
      break;
    }
  }

  const double sin_lat = std::sin(lat);
  n = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sin_lat * sin_lat);
  pos.lat_deg = rad2deg(lat);
  pos.height_m = p / std::cos(lat) - n;
  return pos;
}

Xyz geodeticToEcef(const GeodeticPosition& pos) {
  const double lat = deg2rad(pos.lat_deg);
  const double lon = deg2rad(pos.lon_deg);
  const double sin_lat = std::sin(lat);
  const double n = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sin_lat * sin_lat);

  Xyz r;
  r << (n + pos.height_m) * std::cos(lat) * std::cos(lon),
       (n + pos.height_m) * std::cos(lat) * std::sin(lon),
       (n * (1.0 - kWgs84E2) + pos.height_m) * sin_lat;
  return r;
}

}  // namespace telmodel
