/// @file array_config.cpp
/// @brief Telescope name helpers and array configuration providers.

#include "telmodel/array_config.h"

#include <fstream>
#include <stdexcept>

#include "telmodel/io_utils.h"

namespace telmodel {

bool is_valid_telescope_name(const std::string &name) {
    for (const char *valid : kTelescopeNames) {
        if (name == valid) {
            return true;
        }
    }
    return false;
}

std::string provider_key(const std::string &telescope_name) {
    if (telescope_name == "AAstar") {
        return "AA*";
    }
    return telescope_name;
}

std::vector<std::string> InMemoryArrayConfigProvider::keys() const {
    std::vector<std::string> out;
    out.reserve(configs_.size());
    for (const auto &[key, config] : configs_) {
        out.push_back(key);
    }
    return out;
}

ArrayConfig InMemoryArrayConfigProvider::resolve(const std::string &key) const {
    auto it = configs_.find(key);
    if (it == configs_.end()) {
        throw std::out_of_range(fmt::format("unknown array configuration '{}'", key));
    }
    return it->second;
}

namespace {

Xyz parse_xyz(const std::vector<std::string> &cells, const std::string &where) {
    Xyz pos;
    pos << parse_double(cells[1], where), parse_double(cells[2], where), parse_double(cells[3], where);
    return pos;
}

} // namespace

CatalogueArrayConfigProvider::CatalogueArrayConfigProvider(const std::string &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error(fmt::format("cannot open array catalogue {}", path));
    }

    ArrayConfig current;
    bool in_section = false;
    bool has_location = false;
    size_t section_line = 0;

    auto finish_section = [&]() {
        if (!in_section) {
            return;
        }
        if (!has_location) {
            throw std::runtime_error(fmt::format(
                "{}:{}: array '{}' has no location line", path, section_line, current.name));
        }
        if (configs_.count(current.name)) {
            throw std::runtime_error(fmt::format(
                "{}:{}: array '{}' defined twice", path, section_line, current.name));
        }
        add(std::move(current));
        current = ArrayConfig();
    };

    std::string line;
    size_t line_no = 0;
    while (std::getline(input, line)) {
        ++line_no;
        const std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        if (stripped.front() == '[') {
            if (stripped.back() != ']' || stripped.size() < 3) {
                throw std::runtime_error(fmt::format("{}:{}: bad section header '{}'", path, line_no, stripped));
            }
            finish_section();
            current.name = trim(stripped.substr(1, stripped.size() - 2));
            in_section = true;
            has_location = false;
            section_line = line_no;
            continue;
        }

        const std::string where = fmt::format("{}:{}", path, line_no);
        if (!in_section) {
            throw std::runtime_error(fmt::format("{}: entry outside of an [array] section", where));
        }
        const std::vector<std::string> cells = split_csv_line(stripped);
        if (cells.size() != 4) {
            throw std::runtime_error(fmt::format("{}: expected 4 columns, found {}", where, cells.size()));
        }
        if (cells[0] == "location") {
            if (has_location) {
                throw std::runtime_error(fmt::format("{}: duplicate location line", where));
            }
            current.location = parse_xyz(cells, where);
            has_location = true;
        } else if (cells[0].empty()) {
            throw std::runtime_error(fmt::format("{}: empty station name", where));
        } else {
            current.add_station(cells[0], parse_xyz(cells, where));
        }
    }
    finish_section();

    LOG(INFO) << fmt::format("Loaded {} array configurations from {}", configs_.size(), path);
}

} // namespace telmodel
