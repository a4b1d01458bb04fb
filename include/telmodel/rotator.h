#pragma once

/// @file rotator.h
/// @brief PlanarRotator: 2D rotation of antenna coordinate rows.

#include <cmath>

#include <Eigen/Dense>

#include "telmodel/defines.h"

namespace telmodel {

/// @brief Rotation by a fixed angle in the station-local plane.
///
/// Builds R = [[cos t, -sin t], [sin t, cos t]] and stores P = R^T, so that
/// rotating a row matrix of coordinates is output = input * P, i.e. every
/// row is mapped to R * row.
class PlanarRotator {
  public:
    explicit PlanarRotator(double angle_deg)
        : angle_deg_(angle_deg) {
        const double theta = deg2rad(angle_deg);
        Rot2 R;
        R << std::cos(theta), -std::sin(theta),
             std::sin(theta), std::cos(theta);
        this->P = R.transpose();
    }

    PlanarRotator()
        : P(Rot2::Identity()) {}

    /// @brief Rotate every row of A and store the result in ROT_A.
    /// ROT_A = A * P
    void rotate(const CoordMat &A, CoordMat &ROT_A) const {
        ROT_A = A * P;
    }

    /// @brief Rotate a single (x, y) row vector.
    void rotate(const Eigen::RowVector2d &A, Eigen::RowVector2d &ROT_A) const {
        ROT_A = A * P;
    }

    /// @brief Rotator undoing this one.
    PlanarRotator inverse() const { return PlanarRotator(-angle_deg_); }

    /// @brief Access the transposed rotation matrix (const).
    auto &get_P() const { return P; }

  private:
    double angle_deg_ = 0.0; ///< Rotation angle in degrees
    Rot2 P;                  ///< Transposed rotation matrix (2 x 2)
};

} // namespace telmodel
