/// @file io_utils.cpp
/// @brief CSV cell parsing, float formatting and exclusive-create files.

#include "telmodel/io_utils.h"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace telmodel {

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_csv_line(const std::string &line) {
    std::vector<std::string> cells;
    size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string::npos) {
            cells.push_back(trim(line.substr(start)));
            break;
        }
        cells.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return cells;
}

double parse_double(const std::string &cell, const std::string &where) {
    if (cell.empty()) {
        throw std::runtime_error(fmt::format("{}: empty numeric field", where));
    }
    const char *begin = cell.c_str();
    char *end = nullptr;
    errno = 0;
    const double value = std::strtod(begin, &end);
    if (end != begin + cell.size()) {
        throw std::runtime_error(fmt::format("{}: '{}' is not a number", where, cell));
    }
    if (errno == ERANGE) {
        throw std::runtime_error(fmt::format("{}: '{}' is out of range", where, cell));
    }
    return value;
}

std::string format_float(double value) {
    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".en") == std::string::npos) {
        text += ".0";
    }
    return text;
}

ExclusiveFile::ExclusiveFile(const std::string &path)
    : path_(path) {
    // "x" fails with EEXIST instead of truncating an existing file.
    fp_ = std::fopen(path.c_str(), "wx");
    if (fp_ == nullptr) {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("cannot create {}", path));
    }
}

ExclusiveFile::~ExclusiveFile() {
    if (fp_ != nullptr) {
        std::fclose(fp_);
    }
}

void ExclusiveFile::close() {
    if (fp_ == nullptr) {
        return;
    }
    int err = 0;
    if (std::ferror(fp_) != 0) {
        // errno is not reliable after a buffered write error
        err = EIO;
    }
    errno = 0;
    if (std::fclose(fp_) != 0 && err == 0) {
        err = errno != 0 ? errno : EIO;
    }
    fp_ = nullptr;
    if (err != 0) {
        throw std::system_error(err, std::generic_category(),
                                fmt::format("failed writing {}", path_));
    }
}

} // namespace telmodel
