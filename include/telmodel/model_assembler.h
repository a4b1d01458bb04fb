#pragma once

/// @file model_assembler.h
/// @brief Builds a telescope model directory for one array configuration.
///
/// Output layout:
///   <root>/telescope_model_<name>[_no_rot|_no_feed_rot]/
///     position.txt              "lon, lat" of the array reference (WGS84)
///     layout.txt                "y, x, z" per station
///     station<NNN>/layout.txt   "x, y" per antenna, 5 decimals
///     station<NNN>/feed_angle.txt  feed angle per antenna (Full mode only)

#include <string>

#include "telmodel/array_config.h"
#include "telmodel/config.h"
#include "telmodel/defines.h"
#include "telmodel/rotation_engine.h"
#include "telmodel/rotation_table.h"

namespace telmodel {

struct BuildSummary {
    std::string output_dir;
    size_t num_stations = 0;
    size_t num_antennas = 0; ///< per station
};

class ModelAssembler {
  public:
    /// @param provider must outlive the assembler.
    ModelAssembler(const ArrayConfigProvider &provider, RotationTable table, CoordMat reference_layout);

    /// @brief Regenerate the model for @p telescope_name under @p output_root.
    ///
    /// An existing model directory of the same name is removed first. A
    /// failure leaves whatever was written so far.
    ///
    /// @throws std::invalid_argument for an unknown telescope name,
    ///         std::out_of_range for a station missing from the rotation
    ///         table or an unknown array, std::system_error on filesystem
    ///         errors.
    BuildSummary build(const std::string &telescope_name, RotationMode mode, const std::string &output_root) const;

    /// @brief Station directory name for index @p idx, e.g. station007.
    static std::string station_dir_name(size_t idx);

    const RotationTable &table() const { return table_; }
    const CoordMat &reference_layout() const { return reference_layout_; }

  private:
    void write_position(const std::string &dir, const ArrayConfig &config) const;
    void write_layout(const std::string &dir, const ArrayConfig &config) const;
    void write_station(const std::string &dir, const StationRotation &station, bool write_feed) const;

    const ArrayConfigProvider &provider_;
    RotationTable table_;
    CoordMat reference_layout_;
};

/// @brief Load the inputs named by @p cfg and run ModelAssembler::build.
BuildSummary build_telescope_model(const BuildConfig &cfg, const ArrayConfigProvider &provider);

} // namespace telmodel
