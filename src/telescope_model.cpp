/// @file telescope_model.cpp
/// @brief ReadTelescopeModel implementation.

#include "telmodel/telescope_model.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "telmodel/io_utils.h"

namespace telmodel {

namespace fs = std::filesystem;

namespace {

/// @brief Read every non-empty line of @p path as a row of @p num_cols numbers.
std::vector<double> ReadNumericRows(const fs::path& path, size_t num_cols,
                                    size_t* num_rows) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error(fmt::format("cannot open {}", path.string()));
  }
  std::vector<double> values;
  *num_rows = 0;
  size_t line_no = 0;
  std::string line;
  while (std::getline(input, line)) {
    ++line_no;
    if (trim(line).empty()) {
      continue;
    }
    const auto cells = split_csv_line(line);
    const std::string where = fmt::format("{}:{}", path.string(), line_no);
    if (cells.size() != num_cols) {
      throw std::runtime_error(fmt::format("{}: expected {} columns, found {}",
                                           where, num_cols, cells.size()));
    }
    for (const auto& cell : cells) {
      values.push_back(parse_double(cell, where));
    }
    ++(*num_rows);
  }
  return values;
}

/// @brief Index of a "stationNNN" directory (three or more digits), or -1.
long StationIndex(const fs::directory_entry& entry) {
  const std::string name = entry.path().filename().string();
  if (!entry.is_directory() || name.size() < 10 ||
      name.compare(0, 7, "station") != 0 ||
      !std::all_of(name.begin() + 7, name.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return -1;
  }
  return std::stol(name.substr(7));
}

}  // anonymous namespace

TelescopeModel ReadTelescopeModel(const std::string& dir) {
  const fs::path root(dir);
  TelescopeModel model;

  size_t rows = 0;
  const auto position = ReadNumericRows(root / "position.txt", 2, &rows);
  if (rows != 1) {
    throw std::runtime_error(
        fmt::format("{}/position.txt: expected one line, found {}", dir, rows));
  }
  model.lon_deg = position[0];
  model.lat_deg = position[1];

  const auto layout = ReadNumericRows(root / "layout.txt", 3, &rows);
  model.layout = Eigen::Map<const XyzRowMat>(
      layout.data(), static_cast<Eigen::Index>(rows), 3);

  std::vector<std::pair<long, fs::path>> station_dirs;
  for (const auto& entry : fs::directory_iterator(root)) {
    const long idx = StationIndex(entry);
    if (idx >= 0) {
      station_dirs.emplace_back(idx, entry.path());
    }
  }
  // By index: "station1000" follows "station999".
  std::sort(station_dirs.begin(), station_dirs.end());

  for (const auto& indexed_dir : station_dirs) {
    const fs::path& station_dir = indexed_dir.second;
    StationModel station;
    station.dir_name = station_dir.filename().string();

    const auto coords = ReadNumericRows(station_dir / "layout.txt", 2, &rows);
    station.antenna_coords = Eigen::Map<const CoordMat>(
        coords.data(), static_cast<Eigen::Index>(rows), 2);

    const fs::path feed_path = station_dir / "feed_angle.txt";
    if (fs::exists(feed_path)) {
      size_t feed_rows = 0;
      station.feed_angles = ReadNumericRows(feed_path, 1, &feed_rows);
      if (feed_rows != rows) {
        LOG(WARNING) << fmt::format(
            "{}: {} feed angles for {} antennas", feed_path.string(),
            feed_rows, rows);
      }
    }
    model.stations.push_back(std::move(station));
  }

  return model;
}

}  // namespace telmodel
