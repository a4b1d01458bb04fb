#pragma once

/// @file rotation_table.h
/// @brief Per-station rotation angles (degrees East of North).

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "telmodel/defines.h"

namespace telmodel {

struct RotationRecord {
  std::string label;
  double rotation_deg = 0.0;
};

/// @brief Ordered rotation table with unique station labels.
///
/// The source file is comma-separated: a fixed number of leading lines is
/// skipped, the next line is the header, and the columns named "label" and
/// "rotation" are read from every following row.
class RotationTable {
 public:
  RotationTable() = default;

  /// @brief Load from file.
  /// @throws std::runtime_error on unreadable or malformed input.
  static RotationTable Load(const std::string& path,
                            size_t header_skip = kRotationTableHeaderSkip);

  /// @brief Append a record.
  /// @throws std::invalid_argument if the label is already present.
  void Add(const std::string& label, double rotation_deg);

  /// @brief Rotation of @p label in degrees.
  /// @throws std::out_of_range naming the label when absent.
  double Rotation(const std::string& label) const;

  bool Contains(const std::string& label) const {
    return index_.count(label) != 0;
  }

  const std::vector<RotationRecord>& Records() const { return records_; }
  size_t Size() const { return records_.size(); }

 private:
  std::vector<RotationRecord> records_;
  std::unordered_map<std::string, size_t> index_;  // label -> records_ slot
};

}  // namespace telmodel
