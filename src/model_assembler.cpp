/// @file model_assembler.cpp
/// @brief ModelAssembler: per-array and per-station output files.

#include "telmodel/model_assembler.h"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "telmodel/geodesy.h"
#include "telmodel/io_utils.h"
#include "telmodel/reference_layout.h"

namespace telmodel {

namespace fs = std::filesystem;

namespace {

void make_directory(const fs::path &dir) {
    std::error_code ec;
    if (!fs::create_directory(dir, ec)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::file_exists);
        }
        throw std::system_error(ec, fmt::format("cannot create directory {}", dir.string()));
    }
}

} // namespace

ModelAssembler::ModelAssembler(const ArrayConfigProvider &provider, RotationTable table, CoordMat reference_layout)
    : provider_(provider), table_(std::move(table)), reference_layout_(std::move(reference_layout)) {}

std::string ModelAssembler::station_dir_name(size_t idx) {
    return fmt::format("station{:03d}", idx);
}

BuildSummary ModelAssembler::build(const std::string &telescope_name, RotationMode mode,
                                   const std::string &output_root) const {
    if (!is_valid_telescope_name(telescope_name)) {
        throw std::invalid_argument(fmt::format("unknown telescope '{}'", telescope_name));
    }

    BuildConfig cfg;
    cfg.telescope_name = telescope_name;
    cfg.mode = mode;

    const ArrayConfig config = provider_.resolve(provider_key(telescope_name));
    CHECK_EQ(config.xyz.rows(), static_cast<Eigen::Index>(config.names.size()));
    LOG(INFO) << fmt::format("Array {} ({}): {} stations, mode {}", telescope_name, config.name,
                             config.num_stations(), to_string(mode));

    const fs::path out_dir = fs::path(output_root) / cfg.output_dir_name();
    if (fs::exists(out_dir) && fs::is_directory(out_dir)) {
        LOG(INFO) << "Removing previous model " << out_dir.string();
        fs::remove_all(out_dir);
    }
    make_directory(out_dir);

    write_position(out_dir.string(), config);
    write_layout(out_dir.string(), config);

    const bool write_feed = cfg.writes_feed_angles();
    for (size_t station_idx = 0; station_idx < config.num_stations(); ++station_idx) {
        const std::string &station_name = config.names[station_idx];
        LOG(INFO) << station_idx << " " << station_name;

        const std::string source_label =
            mode == RotationMode::NoStationRotation ? std::string(kReferenceLabel) : station_name;
        // Rotate before touching the filesystem so a missing label leaves nothing behind.
        const StationRotation station = rotate_station(table_, reference_layout_, source_label);

        const fs::path station_dir = out_dir / station_dir_name(station_idx);
        make_directory(station_dir);
        write_station(station_dir.string(), station, write_feed);
    }

    BuildSummary summary;
    summary.output_dir = out_dir.string();
    summary.num_stations = config.num_stations();
    summary.num_antennas = static_cast<size_t>(reference_layout_.rows());
    LOG(INFO) << fmt::format("Wrote {} stations x {} antennas to {}", summary.num_stations, summary.num_antennas,
                             summary.output_dir);
    return summary;
}

void ModelAssembler::write_position(const std::string &dir, const ArrayConfig &config) const {
    const GeodeticPosition pos = ecefToGeodetic(config.location);
    ExclusiveFile file(dir + "/position.txt");
    file.print("{}, {}", format_float(pos.lon_deg), format_float(pos.lat_deg));
    file.close();
}

void ModelAssembler::write_layout(const std::string &dir, const ArrayConfig &config) const {
    ExclusiveFile file(dir + "/layout.txt");
    for (Eigen::Index i = 0; i < config.xyz.rows(); ++i) {
        // y before x
        file.print("{}, {}, {}\n", format_float(config.xyz(i, 1)), format_float(config.xyz(i, 0)),
                   format_float(config.xyz(i, 2)));
    }
    file.close();
}

void ModelAssembler::write_station(const std::string &dir, const StationRotation &station, bool write_feed) const {
    const CoordMat &coords = station.antenna_coords;
    {
        ExclusiveFile file(dir + "/layout.txt");
        for (Eigen::Index ant_idx = 0; ant_idx < coords.rows(); ++ant_idx) {
            file.print("{}, {}\n", format_fixed(coords(ant_idx, 0), kOutputDecimals),
                       format_fixed(coords(ant_idx, 1), kOutputDecimals));
        }
        file.close();
    }

    if (!write_feed) {
        return;
    }
    const std::string angle = format_fixed(feed_angle_deg(station.absolute_rotation_deg), kOutputDecimals);
    ExclusiveFile file(dir + "/feed_angle.txt");
    for (Eigen::Index ant_idx = 0; ant_idx < coords.rows(); ++ant_idx) {
        file.print("{}\n", angle);
    }
    file.close();
}

BuildSummary build_telescope_model(const BuildConfig &cfg, const ArrayConfigProvider &provider) {
    RotationTable table = RotationTable::Load(cfg.rotation_table_path);
    CoordMat layout = LoadReferenceLayout(cfg.reference_layout_path);
    ModelAssembler assembler(provider, std::move(table), std::move(layout));
    return assembler.build(cfg.telescope_name, cfg.mode, cfg.output_root);
}

} // namespace telmodel
