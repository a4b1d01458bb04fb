#pragma once

/// @file reference_layout.h
/// @brief Antenna layout of the reference station.

#include <string>

#include "telmodel/defines.h"

namespace telmodel {

/// @brief Read the reference station's local antenna coordinates.
///
/// Each row is "x, y[, extra...]"; only the first two columns are kept.
/// Blank lines and lines starting with '#' are skipped. Every row must carry
/// the same number of numeric columns, at least two.
///
/// @return N x 2 matrix, rows in file order.
/// @throws std::runtime_error on unreadable or malformed input.
CoordMat LoadReferenceLayout(const std::string& path);

}  // namespace telmodel
