#pragma once

/// @file telescope_model.h
/// @brief Read a generated telescope model directory back into memory.

#include <string>
#include <vector>

#include "telmodel/defines.h"

namespace telmodel {

struct StationModel {
  std::string dir_name;         // e.g. "station004"
  CoordMat antenna_coords;      // N x 2 as written (5 decimals)
  std::vector<double> feed_angles;  // empty when no feed_angle.txt

  bool HasFeedAngles() const { return !feed_angles.empty(); }
};

struct TelescopeModel {
  double lon_deg = 0.0;
  double lat_deg = 0.0;
  XyzRowMat layout;                    // rows as written: y, x, z
  std::vector<StationModel> stations;  // station index order
};

/// @brief Parse the model rooted at @p dir.
/// @throws std::runtime_error if a required file is missing or malformed.
TelescopeModel ReadTelescopeModel(const std::string& dir);

}  // namespace telmodel
