/// @file telmodel_build.cpp
/// @brief Command-line tool: generate a telescope model directory.
///
///   telmodel_build --telescope=AA1 [--no_rot | --no_feed_rot]
///                  [--rotation_table=...] [--reference_layout=...]
///                  [--array_catalogue=...] [--output_root=...]

#include <exception>
#include <string>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <fmt/core.h>

#include "telmodel/array_config.h"
#include "telmodel/config.h"
#include "telmodel/model_assembler.h"

DEFINE_string(telescope, "", "Array to generate: AA0.5, AA1, AA2, AAstar or AA4 (required)");
DEFINE_bool(no_rot, false, "Use the reference station layout for every station, no feed angles");
DEFINE_bool(no_feed_rot, false, "Rotate station layouts but write no feed angles");
DEFINE_string(rotation_table, "./low_array_coords.dat", "Station rotation table (CSV, 21 preamble lines)");
DEFINE_string(reference_layout, "./s8-1.txt", "Antenna layout of reference station S8-1 (CSV x, y, ...)");
DEFINE_string(array_catalogue, "./array_configs.txt", "Array configuration catalogue");
DEFINE_string(output_root, ".", "Directory in which the model directory is created");

static bool ValidateTelescope(const char *flagname, const std::string &value) {
    if (telmodel::is_valid_telescope_name(value)) {
        return true;
    }
    std::string names;
    for (const char *name : telmodel::kTelescopeNames) {
        names += names.empty() ? name : fmt::format(", {}", name);
    }
    fmt::print(stderr, "Invalid value for --{}: '{}' (expected one of {})\n", flagname, value, names);
    return false;
}
DEFINE_validator(telescope, &ValidateTelescope);

int main(int argc, char *argv[]) {
    gflags::SetUsageMessage("Generate a telescope model (station and antenna layouts) for an array");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    if (FLAGS_no_rot && FLAGS_no_feed_rot) {
        LOG(ERROR) << "--no_rot and --no_feed_rot are mutually exclusive";
        return 1;
    }

    telmodel::BuildConfig cfg;
    cfg.telescope_name = FLAGS_telescope;
    if (FLAGS_no_rot) {
        cfg.mode = telmodel::RotationMode::NoStationRotation;
    } else if (FLAGS_no_feed_rot) {
        cfg.mode = telmodel::RotationMode::NoFeedRotation;
    }
    cfg.rotation_table_path = FLAGS_rotation_table;
    cfg.reference_layout_path = FLAGS_reference_layout;
    cfg.output_root = FLAGS_output_root;

    try {
        telmodel::CatalogueArrayConfigProvider provider(FLAGS_array_catalogue);
        const telmodel::BuildSummary summary = telmodel::build_telescope_model(cfg, provider);
        LOG(INFO) << "Telescope model written to " << summary.output_dir;
    } catch (const std::exception &e) {
        LOG(ERROR) << "Build failed: " << e.what();
        gflags::ShutDownCommandLineFlags();
        return 1;
    }

    gflags::ShutDownCommandLineFlags();
    return 0;
}
