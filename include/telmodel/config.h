#pragma once

#include <string>

#include <fmt/core.h>

#include "telmodel/defines.h"

namespace telmodel {

inline const char *to_string(RotationMode mode) {
    switch (mode) {
    case RotationMode::Full:
        return "full";
    case RotationMode::NoStationRotation:
        return "no_rot";
    case RotationMode::NoFeedRotation:
        return "no_feed_rot";
    }
    return "unknown";
}

struct BuildConfig {
    std::string telescope_name;                          // one of kTelescopeNames
    RotationMode mode = RotationMode::Full;              // station/feed rotation mode
    std::string rotation_table_path = "./low_array_coords.dat";
    std::string reference_layout_path = "./s8-1.txt";
    std::string output_root = ".";                       // parent of the model directory

    /// Directory name of the generated model, e.g. telescope_model_AA1_no_rot.
    std::string output_dir_name() const {
        std::string name = fmt::format("telescope_model_{}", telescope_name);
        switch (mode) {
        case RotationMode::Full:
            break;
        case RotationMode::NoStationRotation:
            name += "_no_rot";
            break;
        case RotationMode::NoFeedRotation:
            name += "_no_feed_rot";
            break;
        }
        return name;
    }

    bool writes_feed_angles() const { return mode == RotationMode::Full; }
};

} // namespace telmodel
