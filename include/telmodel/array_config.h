#pragma once

/// @file array_config.h
/// @brief Array configurations (station names and positions) and the
///        providers that resolve them by array name.

#include <array>
#include <map>
#include <utility>
#include <string>
#include <vector>

#include "telmodel/defines.h"

namespace telmodel {

/// Array names accepted on the command line.
constexpr std::array<const char *, 5> kTelescopeNames = {"AA0.5", "AA1", "AA2", "AAstar", "AA4"};

bool is_valid_telescope_name(const std::string &name);

/// @brief Provider key for a telescope name; "AAstar" is looked up as "AA*".
std::string provider_key(const std::string &telescope_name);

/// @brief One array: geocentric reference location plus stations in order.
struct ArrayConfig {
    std::string name;
    Xyz location = Xyz::Zero();     ///< Geocentric (ECEF) reference [m]
    std::vector<std::string> names; ///< Station names, provider order
    XyzRowMat xyz;                  ///< Station positions, row i for names[i]

    size_t num_stations() const { return names.size(); }

    void add_station(const std::string &station, const Xyz &pos) {
        CHECK_EQ(xyz.rows(), static_cast<Eigen::Index>(names.size()));
        names.push_back(station);
        xyz.conservativeResize(xyz.rows() + 1, Eigen::NoChange);
        xyz.row(xyz.rows() - 1) = pos.transpose();
    }
};

class ArrayConfigProvider {
  public:
    virtual ~ArrayConfigProvider() {}

    /// @throws std::out_of_range naming @p key when it is unknown.
    virtual ArrayConfig resolve(const std::string &key) const = 0;
};

class InMemoryArrayConfigProvider : public ArrayConfigProvider {
  protected:
    std::map<std::string, ArrayConfig> configs_;

  public:
    InMemoryArrayConfigProvider() {}
    ~InMemoryArrayConfigProvider() {}

    /// @brief Register @p config under its name, replacing any previous one.
    void add(ArrayConfig config) {
        CHECK_EQ(config.xyz.rows(), static_cast<Eigen::Index>(config.names.size()))
            << "station names and positions differ in length";
        std::string key = config.name;
        configs_[key] = std::move(config);
    }

    std::vector<std::string> keys() const;

    ArrayConfig resolve(const std::string &key) const override;
};

/// @brief Provider backed by a catalogue file.
///
/// Format:
///   # comment
///   [AA0.5]
///   location, X, Y, Z
///   S8-1, x, y, z
///   ...
/// Every section needs one location line; stations keep file order.
class CatalogueArrayConfigProvider : public InMemoryArrayConfigProvider {
  public:
    /// @throws std::runtime_error on unreadable or malformed catalogue.
    explicit CatalogueArrayConfigProvider(const std::string &path);
};

} // namespace telmodel
