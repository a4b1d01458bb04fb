/// @file model_assembler_test.cpp
/// @brief End-to-end tests: model directory layout, rotation modes, failure
///        handling, and reading a generated model back.

#include "telmodel/model_assembler.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <glog/logging.h>

#include "telmodel/geodesy.h"
#include "telmodel/telescope_model.h"
#include "test_utils.h"

namespace {

namespace fs = std::filesystem;
using telmodel_test::MakeTempDir;
using telmodel_test::ReadFile;
using telmodel_test::RotationTableHeader;
using telmodel_test::WriteFile;

constexpr double kEpsilon = 1e-9;

const char* kUnrotated = "1.00000, 0.00000\n0.00000, 1.00000\n";

telmodel::RotationTable MakeTable() {
  telmodel::RotationTable table;
  table.Add("S8-1", 30.0);
  table.Add("A", 30.0);
  table.Add("B", 120.0);
  return table;
}

telmodel::CoordMat TwoAntennas() {
  telmodel::CoordMat layout(2, 2);
  layout << 1.0, 0.0,
            0.0, 1.0;
  return layout;
}

telmodel::ArrayConfig MakeArray(const std::string& name,
                                std::initializer_list<const char*> stations) {
  telmodel::ArrayConfig config;
  config.name = name;
  config.location = telmodel::geodeticToEcef({116.7644482, -26.82472208, 377.8});
  double offset = 1.0;
  for (const char* station : stations) {
    config.add_station(station, telmodel::Xyz(offset, 2.0 * offset, 0.25));
    offset += 1.0;
  }
  return config;
}

telmodel::InMemoryArrayConfigProvider MakeProvider() {
  telmodel::InMemoryArrayConfigProvider provider;
  provider.add(MakeArray("AA0.5", {"S8-1", "A", "B"}));
  provider.add(MakeArray("AA*", {"B", "A"}));
  provider.add(MakeArray("AA1", {"S8-1", "A", "C"}));
  return provider;
}

void TestFullModeEndToEnd() {
  auto root = MakeTempDir("full");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  auto summary = assembler.build("AA0.5", telmodel::RotationMode::Full, root.string());
  const fs::path out = root / "telescope_model_AA0.5";
  assert(summary.output_dir == out.string());
  assert(summary.num_stations == 3);
  assert(summary.num_antennas == 2);

  // Global layout: y, x, z per station
  assert(ReadFile(out / "layout.txt") ==
         "2.0, 1.0, 0.25\n4.0, 2.0, 0.25\n6.0, 3.0, 0.25\n");

  // Reference station: unrotated, feed angle from the fixed 251.3
  assert(ReadFile(out / "station000" / "layout.txt") == kUnrotated);
  assert(ReadFile(out / "station000" / "feed_angle.txt") ==
         "198.70000\n198.70000\n");

  // A has the reference rotation: identity
  assert(ReadFile(out / "station001" / "layout.txt") == kUnrotated);
  assert(ReadFile(out / "station001" / "feed_angle.txt") ==
         "60.00000\n60.00000\n");

  // B: theta = 30 - 120 = -90
  assert(ReadFile(out / "station002" / "layout.txt") ==
         "0.00000, -1.00000\n1.00000, 0.00000\n");
  assert(ReadFile(out / "station002" / "feed_angle.txt") ==
         "330.00000\n330.00000\n");

  assert(!fs::exists(out / "station003"));
  std::printf("TestFullModeEndToEnd: OK\n");
}

void TestPositionFile() {
  auto root = MakeTempDir("position");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());
  assembler.build("AA0.5", telmodel::RotationMode::Full, root.string());

  const std::string text =
      ReadFile(root / "telescope_model_AA0.5" / "position.txt");
  // Single line, no trailing newline
  assert(text.find('\n') == std::string::npos);
  assert(text.find(", ") != std::string::npos);

  auto model = telmodel::ReadTelescopeModel(
      (root / "telescope_model_AA0.5").string());
  assert(std::abs(model.lon_deg - 116.7644482) < kEpsilon);
  assert(std::abs(model.lat_deg + 26.82472208) < kEpsilon);
  std::printf("TestPositionFile: OK\n");
}

void TestNoStationRotation() {
  auto root = MakeTempDir("norot");
  auto provider = MakeProvider();
  // Only the reference label is needed in this mode.
  telmodel::RotationTable table;
  table.Add("S8-1", 30.0);
  telmodel::ModelAssembler assembler(provider, std::move(table), TwoAntennas());

  assembler.build("AA0.5", telmodel::RotationMode::NoStationRotation,
                  root.string());
  const fs::path out = root / "telescope_model_AA0.5_no_rot";
  const std::string reference = ReadFile(out / "station000" / "layout.txt");
  assert(reference == kUnrotated);
  for (const char* station : {"station000", "station001", "station002"}) {
    assert(ReadFile(out / station / "layout.txt") == reference);
    assert(!fs::exists(out / station / "feed_angle.txt"));
  }
  std::printf("TestNoStationRotation: OK\n");
}

void TestNoFeedRotation() {
  auto root = MakeTempDir("nofeed");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  assembler.build("AA0.5", telmodel::RotationMode::NoFeedRotation,
                  root.string());
  const fs::path out = root / "telescope_model_AA0.5_no_feed_rot";
  assert(ReadFile(out / "station002" / "layout.txt") ==
         "0.00000, -1.00000\n1.00000, 0.00000\n");
  for (const char* station : {"station000", "station001", "station002"}) {
    assert(fs::exists(out / station / "layout.txt"));
    assert(!fs::exists(out / station / "feed_angle.txt"));
  }
  std::printf("TestNoFeedRotation: OK\n");
}

void TestAliasResolvesProviderKey() {
  auto root = MakeTempDir("alias");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  auto summary = assembler.build("AAstar", telmodel::RotationMode::Full,
                                 root.string());
  // Directory keeps the display name, stations come from "AA*".
  assert(summary.output_dir == (root / "telescope_model_AAstar").string());
  assert(summary.num_stations == 2);
  assert(ReadFile(root / "telescope_model_AAstar" / "station001" / "layout.txt") ==
         kUnrotated);
  std::printf("TestAliasResolvesProviderKey: OK\n");
}

void TestMissingLabelAborts() {
  auto root = MakeTempDir("missing");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  bool thrown = false;
  try {
    assembler.build("AA1", telmodel::RotationMode::Full, root.string());
  } catch (const std::out_of_range& e) {
    thrown = std::string(e.what()).find("'C'") != std::string::npos;
  }
  assert(thrown);

  const fs::path out = root / "telescope_model_AA1";
  // Stations before the failure were written, the failing one was not.
  assert(fs::exists(out / "station001" / "layout.txt"));
  assert(!fs::exists(out / "station002" / "layout.txt"));
  assert(!fs::exists(out / "station002" / "feed_angle.txt"));
  std::printf("TestMissingLabelAborts: OK\n");
}

void TestRebuildReplacesPreviousModel() {
  auto root = MakeTempDir("rebuild");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  assembler.build("AA0.5", telmodel::RotationMode::Full, root.string());
  const fs::path out = root / "telescope_model_AA0.5";
  WriteFile(out / "stale.txt", "left over");
  fs::create_directory(out / "station099");

  assembler.build("AA0.5", telmodel::RotationMode::Full, root.string());
  assert(!fs::exists(out / "stale.txt"));
  assert(!fs::exists(out / "station099"));
  assert(ReadFile(out / "station002" / "feed_angle.txt") ==
         "330.00000\n330.00000\n");
  std::printf("TestRebuildReplacesPreviousModel: OK\n");
}

void TestOutputPathIsAFile() {
  auto root = MakeTempDir("collision");
  WriteFile(root / "telescope_model_AA0.5", "not a directory");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  bool thrown = false;
  try {
    assembler.build("AA0.5", telmodel::RotationMode::Full, root.string());
  } catch (const std::system_error&) {
    thrown = true;
  }
  assert(thrown);
  assert(ReadFile(root / "telescope_model_AA0.5") == "not a directory");
  std::printf("TestOutputPathIsAFile: OK\n");
}

void TestUnknownNames() {
  auto root = MakeTempDir("unknown");
  auto provider = MakeProvider();
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  bool invalid = false;
  try {
    assembler.build("AA3", telmodel::RotationMode::Full, root.string());
  } catch (const std::invalid_argument&) {
    invalid = true;
  }
  assert(invalid);

  // Valid name the provider does not know: nothing is created.
  bool unknown = false;
  try {
    assembler.build("AA4", telmodel::RotationMode::Full, root.string());
  } catch (const std::out_of_range& e) {
    unknown = std::string(e.what()).find("AA4") != std::string::npos;
  }
  assert(unknown);
  assert(!fs::exists(root / "telescope_model_AA4"));
  std::printf("TestUnknownNames: OK\n");
}

void TestBuildFromFiles() {
  auto root = MakeTempDir("files");
  WriteFile(root / "low_array_coords.dat",
            RotationTableHeader() +
                "S8-1,0,0,30\nA,0,0,30\nB,0,0,120\n");
  WriteFile(root / "s8-1.txt", "1.0, 0.0, 0.0\n0.0, 1.0, 0.0\n");

  telmodel::BuildConfig cfg;
  cfg.telescope_name = "AA0.5";
  cfg.mode = telmodel::RotationMode::Full;
  cfg.rotation_table_path = (root / "low_array_coords.dat").string();
  cfg.reference_layout_path = (root / "s8-1.txt").string();
  cfg.output_root = root.string();
  assert(cfg.output_dir_name() == "telescope_model_AA0.5");

  auto provider = MakeProvider();
  auto summary = telmodel::build_telescope_model(cfg, provider);
  assert(summary.num_stations == 3);

  auto model = telmodel::ReadTelescopeModel(summary.output_dir);
  assert(model.layout.rows() == 3);
  assert(model.layout(0, 0) == 2.0 && model.layout(0, 1) == 1.0);
  assert(model.stations.size() == 3);
  assert(model.stations[2].dir_name == "station002");
  assert(model.stations[2].antenna_coords(0, 1) == -1.0);
  assert(model.stations[2].antenna_coords(1, 0) == 1.0);
  assert(model.stations[0].HasFeedAngles());
  assert(model.stations[0].feed_angles.size() == 2);
  assert(std::abs(model.stations[0].feed_angles[0] - 198.7) < kEpsilon);

  cfg.mode = telmodel::RotationMode::NoFeedRotation;
  assert(cfg.output_dir_name() == "telescope_model_AA0.5_no_feed_rot");
  cfg.mode = telmodel::RotationMode::NoStationRotation;
  assert(cfg.output_dir_name() == "telescope_model_AA0.5_no_rot");
  auto no_rot = telmodel::ReadTelescopeModel(
      telmodel::build_telescope_model(cfg, provider).output_dir);
  for (const auto& station : no_rot.stations) {
    assert(!station.HasFeedAngles());
  }
  std::printf("TestBuildFromFiles: OK\n");
}

void TestReadBackFourDigitStations() {
  auto root = MakeTempDir("many_stations");
  telmodel::ArrayConfig config;
  config.name = "AA4";
  for (int i = 0; i < 1002; ++i) {
    config.add_station("S8-1", telmodel::Xyz(i, 0.0, 0.0));
  }
  telmodel::InMemoryArrayConfigProvider provider;
  provider.add(config);
  telmodel::ModelAssembler assembler(provider, MakeTable(), TwoAntennas());

  auto summary = assembler.build(
      "AA4", telmodel::RotationMode::NoStationRotation, root.string());
  assert(fs::is_directory(fs::path(summary.output_dir) / "station1001"));

  auto model = telmodel::ReadTelescopeModel(summary.output_dir);
  assert(model.stations.size() == 1002);
  assert(model.stations[99].dir_name == "station099");
  assert(model.stations[999].dir_name == "station999");
  assert(model.stations[1000].dir_name == "station1000");
  assert(model.stations[1001].dir_name == "station1001");
  std::printf("TestReadBackFourDigitStations: OK\n");
}

}  // namespace

int main(int argc, char* argv[]) {
  (void)argc;
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  TestFullModeEndToEnd();
  TestPositionFile();
  TestNoStationRotation();
  TestNoFeedRotation();
  TestAliasResolvesProviderKey();
  TestMissingLabelAborts();
  TestRebuildReplacesPreviousModel();
  TestOutputPathIsAFile();
  TestUnknownNames();
  TestBuildFromFiles();
  TestReadBackFourDigitStations();

  std::printf("\nAll model assembler tests passed!\n");
  return 0;
}
