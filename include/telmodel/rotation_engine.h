#pragma once

/// @file rotation_engine.h
/// @brief Station antenna layouts derived from the reference station.
///
/// Every station shares the reference station's local antenna geometry,
/// turned by the difference between the reference rotation and the
/// station's own rotation (both East of North, clockwise positive).

#include <string>

#include "telmodel/defines.h"
#include "telmodel/rotation_table.h"

namespace telmodel {

/// @brief Antenna positions of one station and its absolute rotation.
struct StationRotation {
    CoordMat antenna_coords;            ///< N x 2, reference antenna order
    double absolute_rotation_deg = 0.0; ///< Degrees East of North
};

/// @brief Rotate the reference layout into the frame of @p station_label.
///
/// The reference station itself gets the layout unchanged and the fixed
/// rotation kReferenceRotationDeg, whatever the table holds for it. Any other
/// station is rotated by theta = rotation(reference) - rotation(station).
///
/// @throws std::out_of_range naming the label if the reference or the
///         station label is missing from @p table.
StationRotation rotate_station(const RotationTable &table,
                               const CoordMat &reference_layout,
                               const std::string &station_label);

/// @brief Feed element angle for the downstream simulator:
///        (90 - absolute_rotation_deg) mod 360, in [0, 360).
double feed_angle_deg(double absolute_rotation_deg);

} // namespace telmodel
