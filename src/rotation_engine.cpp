/// @file rotation_engine.cpp
/// @brief rotate_station and feed_angle_deg.

#include "telmodel/rotation_engine.h"

#include <cmath>

#include "telmodel/rotator.h"

namespace telmodel {

StationRotation rotate_station(const RotationTable &table,
                               const CoordMat &reference_layout,
                               const std::string &station_label) {
    const double ref_rot = table.Rotation(kReferenceLabel);

    StationRotation result;
    if (station_label == kReferenceLabel) {
        result.antenna_coords = reference_layout;
        result.absolute_rotation_deg = kReferenceRotationDeg;
        return result;
    }

    const double station_rot = table.Rotation(station_label);
    PlanarRotator rotator(ref_rot - station_rot);
    rotator.rotate(reference_layout, result.antenna_coords);
    result.absolute_rotation_deg = station_rot;

    DCHECK_EQ(result.antenna_coords.rows(), reference_layout.rows());
    return result;
}

double feed_angle_deg(double absolute_rotation_deg) {
    double angle = std::fmod(90.0 - absolute_rotation_deg, 360.0);
    if (angle < 0.0) {
        angle += 360.0;
    }
    // fmod of a tiny negative value can round back up to 360
    if (angle >= 360.0) {
        angle -= 360.0;
    }
    // no "-0.00000" in the output
    if (angle == 0.0) {
        angle = 0.0;
    }
    return angle;
}

} // namespace telmodel
