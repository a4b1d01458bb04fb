/// @file reference_layout.cpp
/// @brief LoadReferenceLayout implementation.

#include "telmodel/reference_layout.h"

#include <fstream>
#include <stdexcept>
#include <vector>

#include "telmodel/io_utils.h"

namespace telmodel {

CoordMat LoadReferenceLayout(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error(
        fmt::format("cannot open reference layout {}", path));
  }

  std::vector<double> xy;
  size_t num_cols = 0;
  size_t line_no = 0;
  std::string line;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#') {
      continue;
    }
    const std::vector<std::string> cells = split_csv_line(stripped);
    if (num_cols == 0) {
      num_cols = cells.size();
      if (num_cols < 2) {
        throw std::runtime_error(fmt::format(
            "{}:{}: need at least 2 columns (x, y), found {}", path, line_no,
            num_cols));
      }
    } else if (cells.size() != num_cols) {
      throw std::runtime_error(fmt::format(
          "{}:{}: expected {} columns, found {}", path, line_no, num_cols,
          cells.size()));
    }

    const std::string where = fmt::format("{}:{}", path, line_no);
    for (size_t c = 0; c < cells.size(); ++c) {
      const double value = parse_double(cells[c], where);
      if (c < 2) {
        xy.push_back(value);
      }
    }
  }

  if (xy.empty()) {
    throw std::runtime_error(
        fmt::format("{}: no antenna coordinates", path));
  }

  const Eigen::Index n = static_cast<Eigen::Index>(xy.size() / 2);
  CoordMat layout = Eigen::Map<const CoordMat>(xy.data(), n, 2);
  LOG(INFO) << fmt::format("Loaded {} reference antennas from {}", n, path);
  return layout;
}

}  // namespace telmodel
