#pragma once

/// @file io_utils.h
/// @brief Text helpers shared by the loaders and the model writer.

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace telmodel {

/// @brief Split a comma-separated line into whitespace-trimmed cells.
std::vector<std::string> split_csv_line(const std::string &line);

/// @brief Trim leading and trailing whitespace (including '\r').
std::string trim(const std::string &s);

/// @brief Parse a whole cell as a double.
/// @throws std::runtime_error naming @p where when the cell is not numeric.
double parse_double(const std::string &cell, const std::string &where);

/// @brief Shortest round-trip text of @p value, always carrying a decimal
///        point or exponent ("1.0", "-2565018.75", "1e-07").
std::string format_float(double value);

/// @brief Fixed-point text with @p decimals digits after the point.
inline std::string format_fixed(double value, int decimals) {
    return fmt::format("{:.{}f}", value, decimals);
}

/// @brief Text file opened with exclusive-create semantics.
///
/// Opening fails when the path already exists. Closed on destruction;
/// call close() to surface write errors.
class ExclusiveFile {
  public:
    /// @throws std::system_error carrying errno and the path.
    explicit ExclusiveFile(const std::string &path);
    ~ExclusiveFile();

    ExclusiveFile(const ExclusiveFile &) = delete;
    ExclusiveFile &operator=(const ExclusiveFile &) = delete;

    template <typename... Args>
    void print(fmt::format_string<Args...> fmt_str, Args &&...args) {
        fmt::print(fp_, fmt_str, std::forward<Args>(args)...);
    }

    /// @throws std::system_error when flushing or closing fails.
    void close();

  private:
    std::string path_;
    std::FILE *fp_ = nullptr;
};

} // namespace telmodel
