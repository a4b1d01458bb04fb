/// @file rotation_table.cpp
/// @brief RotationTable loading and lookup.

#include "telmodel/rotation_table.h"

#include <fstream>
#include <stdexcept>

#include "telmodel/io_utils.h"

namespace telmodel {

namespace {

/// @brief Index of the header cell named @p name, or -1.
int FindColumn(const std::vector<std::string>& header, const char* name) {
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

}  // anonymous namespace

RotationTable RotationTable::Load(const std::string& path,
                                  size_t header_skip) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error(
        fmt::format("cannot open rotation table {}", path));
  }

  std::string line;
  size_t line_no = 0;
  for (size_t i = 0; i < header_skip; ++i) {
    if (!std::getline(input, line)) {
      throw std::runtime_error(fmt::format(
          "{}: expected {} preamble lines, file ends after {}", path,
          header_skip, line_no));
    }
    ++line_no;
  }

  if (!std::getline(input, line)) {
    throw std::runtime_error(
        fmt::format("{}: missing header line after preamble", path));
  }
  ++line_no;
  const std::vector<std::string> header = split_csv_line(line);
  const int label_col = FindColumn(header, "label");
  const int rotation_col = FindColumn(header, "rotation");
  if (label_col < 0 || rotation_col < 0) {
    throw std::runtime_error(fmt::format(
        "{}:{}: header must name 'label' and 'rotation' columns", path,
        line_no));
  }

  RotationTable table;
  while (std::getline(input, line)) {
    ++line_no;
    if (trim(line).empty()) {
      continue;
    }
    const std::vector<std::string> cells = split_csv_line(line);
    if (cells.size() != header.size()) {
      throw std::runtime_error(fmt::format(
          "{}:{}: expected {} columns, found {}", path, line_no,
          header.size(), cells.size()));
    }
    const std::string where = fmt::format("{}:{}", path, line_no);
    const double rotation = parse_double(cells[rotation_col], where);
    try {
      table.Add(cells[label_col], rotation);
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(fmt::format("{}: {}", where, e.what()));
    }
  }

  LOG(INFO) << fmt::format("Loaded {} station rotations from {}",
                           table.Size(), path);
  return table;
}

void RotationTable::Add(const std::string& label, double rotation_deg) {
  if (Contains(label)) {
    throw std::invalid_argument(
        fmt::format("duplicate station label '{}'", label));
  }
  index_.emplace(label, records_.size());
  records_.push_back(RotationRecord{label, rotation_deg});
}

double RotationTable::Rotation(const std::string& label) const {
  auto it = index_.find(label);
  if (it == index_.end()) {
    throw std::out_of_range(fmt::format(
        "station label '{}' not found in rotation table", label));
  }
  return records_[it->second].rotation_deg;
}

}  // namespace telmodel
