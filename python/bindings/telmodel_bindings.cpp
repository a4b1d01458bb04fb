/// @file telmodel_bindings.cpp
/// @brief Python bindings for the telmodel library using pybind11.
///
/// Exposes the rotation table, reference layout loader, rotation engine and
/// model assembler. Coordinates cross as numpy arrays via pybind11/eigen.h.

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "telmodel/array_config.h"
#include "telmodel/config.h"
#include "telmodel/defines.h"
#include "telmodel/geodesy.h"
#include "telmodel/model_assembler.h"
#include "telmodel/reference_layout.h"
#include "telmodel/rotation_engine.h"
#include "telmodel/rotation_table.h"
#include "telmodel/telescope_model.h"

namespace py = pybind11;
using namespace telmodel;

PYBIND11_MODULE(_telmodel_core, m) {
    m.doc() = "telmodel: telescope model generator (C++ core)";

    m.attr("REFERENCE_LABEL") = kReferenceLabel;
    m.attr("REFERENCE_ROTATION_DEG") = kReferenceRotationDeg;
    m.attr("TELESCOPE_NAMES") = std::vector<std::string>(kTelescopeNames.begin(), kTelescopeNames.end());

    // ---- Enums ----
    py::enum_<RotationMode>(m, "RotationMode")
        .value("Full", RotationMode::Full)
        .value("NoStationRotation", RotationMode::NoStationRotation)
        .value("NoFeedRotation", RotationMode::NoFeedRotation)
        .export_values();

    // ---- RotationTable ----
    py::class_<RotationTable>(m, "RotationTable")
        .def(py::init<>())
        .def_static("load", &RotationTable::Load, py::arg("path"),
                    py::arg("header_skip") = kRotationTableHeaderSkip,
                    "Load a rotation table (CSV with 'label' and 'rotation' columns).")
        .def("add", &RotationTable::Add, py::arg("label"), py::arg("rotation_deg"))
        .def("rotation", &RotationTable::Rotation, py::arg("label"),
             "Rotation in degrees East of North. Raises IndexError for an unknown label.")
        .def("__contains__", &RotationTable::Contains)
        .def("__len__", &RotationTable::Size);

    // ---- ArrayConfig ----
    py::class_<ArrayConfig>(m, "ArrayConfig")
        .def(py::init<>())
        .def_readwrite("name", &ArrayConfig::name)
        .def_readwrite("location", &ArrayConfig::location)
        .def_readonly("names", &ArrayConfig::names)
        .def_readonly("xyz", &ArrayConfig::xyz)
        .def("add_station",
             [](ArrayConfig &self, const std::string &station, const Xyz &pos) {
                 self.add_station(station, pos);
             },
             py::arg("name"), py::arg("xyz"));

    py::class_<ArrayConfigProvider>(m, "ArrayConfigProvider")
        .def("resolve", &ArrayConfigProvider::resolve, py::arg("key"));

    py::class_<InMemoryArrayConfigProvider, ArrayConfigProvider>(m, "InMemoryArrayConfigProvider")
        .def(py::init<>())
        .def("add", &InMemoryArrayConfigProvider::add, py::arg("config"))
        .def("keys", &InMemoryArrayConfigProvider::keys);

    py::class_<CatalogueArrayConfigProvider, InMemoryArrayConfigProvider>(m, "CatalogueArrayConfigProvider")
        .def(py::init<const std::string &>(), py::arg("path"));

    // ---- Rotation engine ----
    m.def("load_reference_layout", &LoadReferenceLayout, py::arg("path"),
          "Load reference antenna coordinates. Returns float64 array of shape (n, 2).");

    m.def("rotate_station",
          [](const RotationTable &table, const CoordMat &layout, const std::string &label) {
              StationRotation r = rotate_station(table, layout, label);
              return py::make_tuple(r.antenna_coords, r.absolute_rotation_deg);
          },
          py::arg("table"), py::arg("reference_layout"), py::arg("station_label"),
          "Rotate the reference layout for a station. Returns (coords, absolute_rotation_deg).");

    m.def("feed_angle_deg", &feed_angle_deg, py::arg("absolute_rotation_deg"));

    m.def("ecef_to_geodetic",
          [](const Xyz &xyz) {
              GeodeticPosition pos = ecefToGeodetic(xyz);
              return py::make_tuple(pos.lon_deg, pos.lat_deg, pos.height_m);
          },
          py::arg("xyz"), "Returns (lon_deg, lat_deg, height_m) on WGS84.");

    // ---- Model assembler ----
    py::class_<BuildSummary>(m, "BuildSummary")
        .def_readonly("output_dir", &BuildSummary::output_dir)
        .def_readonly("num_stations", &BuildSummary::num_stations)
        .def_readonly("num_antennas", &BuildSummary::num_antennas);

    py::class_<ModelAssembler>(m, "ModelAssembler")
        .def(py::init<const ArrayConfigProvider &, RotationTable, CoordMat>(),
             py::arg("provider"), py::arg("table"), py::arg("reference_layout"),
             py::keep_alive<1, 2>())
        .def("build",
             [](const ModelAssembler &self, const std::string &telescope, RotationMode mode,
                const std::string &output_root) {
                 py::gil_scoped_release release;
                 return self.build(telescope, mode, output_root);
             },
             py::arg("telescope"), py::arg("mode") = RotationMode::Full, py::arg("output_root") = ".",
             "Regenerate the telescope model directory. Returns a BuildSummary.");

    m.def("read_telescope_model",
          [](const std::string &dir) {
              TelescopeModel model = ReadTelescopeModel(dir);
              py::list stations;
              for (const auto &station : model.stations) {
                  py::dict d;
                  d["name"] = station.dir_name;
                  d["antenna_coords"] = station.antenna_coords;
                  d["feed_angles"] = station.feed_angles;
                  stations.append(d);
              }
              return py::make_tuple(py::make_tuple(model.lon_deg, model.lat_deg), model.layout, stations);
          },
          py::arg("dir"), "Returns ((lon, lat), layout, stations) of a generated model.");
}
