#pragma once

#include <cstddef>
#include <string>

#include <Eigen/Dense>
#include <Eigen/Core>

#include <glog/logging.h>
#include <fmt/core.h>

namespace telmodel {

constexpr const char *kReferenceLabel = "S8-1";
constexpr double kReferenceRotationDeg = 251.3; // not taken from the rotation table
constexpr size_t kRotationTableHeaderSkip = 21;
constexpr int kOutputDecimals = 5;

constexpr double kPi = 3.14159265358979323846;

inline double deg2rad(double deg) { return deg * kPi / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / kPi; }

/// N x 2 antenna coordinates, one antenna per row.
using CoordMat = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;
using Rot2 = Eigen::Matrix<double, 2, 2, Eigen::RowMajor>;
using Xyz = Eigen::Vector3d;
/// N x 3 absolute station positions, one station per row.
using XyzRowMat = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;

enum class RotationMode {
    Full,              // rotate station layout and write feed angles
    NoStationRotation, // reference layout for every station, no feed angles
    NoFeedRotation,    // rotated layouts, no feed angles
};

} // namespace telmodel
