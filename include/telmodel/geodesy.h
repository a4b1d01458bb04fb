#pragma once

/// @file geodesy.h
/// @brief Geocentric (ECEF) to geodetic conversion on the WGS84 ellipsoid.

#include "telmodel/defines.h"

namespace telmodel {

constexpr double kWgs84A = 6378137.0;                 // semi-major axis [m]
constexpr double kWgs84F = 1.0 / 298.257223563;       // flattening
constexpr double kWgs84E2 = kWgs84F * (2.0 - kWgs84F); // first eccentricity squared

struct GeodeticPosition {
  double lon_deg = 0.0;   // (-180, 180]
  double lat_deg = 0.0;   // [-90, 90]
  double height_m = 0.0;  // above the ellipsoid
};

// Convert an ECEF position [m] to WGS84 longitude/latitude [deg] and height [m].
GeodeticPosition ecefToGeodetic(const Xyz& r_ecef_m);

// Inverse of ecefToGeodetic.
Xyz geodeticToEcef(const GeodeticPosition& pos);

}  // namespace telmodel
