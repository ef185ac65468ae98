#include "skydome/core/errors.hpp"
#include "skydome/core/utils.hpp"
#include "skydome/output/exporters.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace out = skydome::output;
using skydome::CellClass;
using skydome::geometry::CameraModel;
using skydome::geometry::DomeGrid;
using skydome::geometry::DomeGridSpec;
namespace fs = std::filesystem;

namespace {

// 3 x 13 cells at 30 degrees.
DomeGrid coarse_grid() {
  DomeGridSpec spec;
  spec.resolution_degrees = 30.0;
  DomeGrid grid(spec);
  grid.add_sample(0, 0, true);
  grid.add_sample(1, 2, false);
  return grid;
}

fs::path scratch(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

} // namespace

TEST_CASE("class_colors") {
  REQUIRE(out::class_color(CellClass::SKY) == out::Rgba{0, 0, 255, 128});
  REQUIRE(out::class_color(CellClass::NOT_SKY) == out::Rgba{255, 0, 0, 128});
  REQUIRE(out::class_color(CellClass::UNSAMPLED) == out::Rgba{128, 128, 128, 128});
}

TEST_CASE("sky_map_document_shape") {
  const DomeGrid grid = coarse_grid();
  const auto doc = out::build_sky_map(grid, CameraModel(), {{"run_id", "r1"}});

  REQUIRE(doc["sky_grid"].size() == 3);
  REQUIRE(doc["sky_grid"][0].size() == 13);
  REQUIRE(doc["sky_grid"][0][0] == true);
  REQUIRE(doc["sky_grid"][1][2] == false);
  REQUIRE(doc["sample_counts"][1][2] == 1);
  REQUIRE(doc["sample_counts"][2][5] == 0);
  REQUIRE(doc["coverage"]["sampled_cells"] == 2);
  REQUIRE(doc["coverage"]["total_cells"] == 39);

  const auto& meta = doc["metadata"];
  REQUIRE(meta["grid_dimensions"][0] == 3);
  REQUIRE(meta["grid_dimensions"][1] == 13);
  REQUIRE(meta["theta_range_degrees"][1].get<double>() == Catch::Approx(60.0));
  REQUIRE(meta["camera_fov_degrees"].get<double>() == Catch::Approx(75.0));
  REQUIRE(meta["image_dimensions"][0] == 1864);
  REQUIRE(meta["run_id"] == "r1");
  REQUIRE(meta["color_scheme"]["sky"] == "blue");
}

TEST_CASE("dome_mesh_topology") {
  const DomeGrid grid = coarse_grid();
  const auto mesh = out::build_dome_mesh(grid, 50.0);
  REQUIRE(mesh.vertices.size() == 39);
  REQUIRE(mesh.colors.size() == 39);
  REQUIRE(mesh.faces.size() == 2 * 2 * 12);

  // Zenith row collapses onto the pole.
  REQUIRE(mesh.vertices[0][2] == Catch::Approx(50.0));
  // Column 12 sits at phi = 360 deg on top of column 0 and closes the ring.
  for (int i = 0; i < 3; ++i) {
    for (int k = 0; k < 3; ++k) {
      REQUIRE(mesh.vertices[i * 13 + 12][k] ==
              Catch::Approx(mesh.vertices[i * 13][k]).margin(1e-4));
    }
  }
  // The last quad of row 0 runs from column 11 to column 12.
  const auto& last = mesh.faces[2 * 11];
  REQUIRE(last[0] == 11);
  REQUIRE(last[1] == 12);
  REQUIRE(last[2] == 24);
  // No face bridges column 12 back to column 0.
  for (const auto& f : mesh.faces) {
    bool has_first = false;
    bool has_last = false;
    for (int v : f) {
      has_first = has_first || v % 13 == 0;
      has_last = has_last || v % 13 == 12;
    }
    REQUIRE_FALSE((has_first && has_last));
  }

  REQUIRE(mesh.colors[0] == out::class_color(CellClass::SKY));
  REQUIRE(mesh.colors[13 + 2] == out::class_color(CellClass::NOT_SKY));
  REQUIRE(mesh.colors[1] == out::class_color(CellClass::UNSAMPLED));
}

TEST_CASE("ply_file_header_and_counts") {
  const fs::path dir = scratch("skydome_test_ply");
  const fs::path path = dir / "model" / "dome_sky_model.ply";
  out::write_dome_ply(coarse_grid(), path, 50.0);

  std::ifstream in(path);
  REQUIRE(in.good());
  std::string line;
  std::getline(in, line);
  REQUIRE(line == "ply");
  std::getline(in, line);
  REQUIRE(line == "format ascii 1.0");

  int vertex_lines = 0;
  int face_lines = 0;
  bool in_body = false;
  bool saw_vertex_count = false;
  bool saw_face_count = false;
  while (std::getline(in, line)) {
    if (!in_body) {
      if (line == "element vertex 39") saw_vertex_count = true;
      if (line == "element face 48") saw_face_count = true;
      if (line == "end_header") in_body = true;
      continue;
    }
    if (line.rfind("3 ", 0) == 0 && vertex_lines == 39) {
      ++face_lines;
    } else {
      ++vertex_lines;
    }
  }
  REQUIRE(saw_vertex_count);
  REQUIRE(saw_face_count);
  REQUIRE(vertex_lines == 39);
  REQUIRE(face_lines == 48);
  fs::remove_all(dir);
}

TEST_CASE("data_texture_pixels_follow_legend") {
  const DomeGrid grid = coarse_grid();
  const cv::Mat tex = out::build_data_texture(grid);
  REQUIRE(tex.rows == 3);
  REQUIRE(tex.cols == 13);
  REQUIRE(tex.type() == CV_8UC4);
  REQUIRE(tex.at<cv::Vec4b>(0, 0) == cv::Vec4b(255, 0, 0, 128));    // sky, BGRA
  REQUIRE(tex.at<cv::Vec4b>(1, 2) == cv::Vec4b(0, 0, 255, 128));    // not sky
  REQUIRE(tex.at<cv::Vec4b>(2, 7) == cv::Vec4b(128, 128, 128, 128));
}

TEST_CASE("data_texture_written_with_metadata") {
  const fs::path dir = scratch("skydome_test_texture");
  out::write_data_texture(coarse_grid(), dir / "dome_sky_texture.png",
                          dir / "texture_metadata.json");

  const cv::Mat back = cv::imread((dir / "dome_sky_texture.png").string(), cv::IMREAD_UNCHANGED);
  REQUIRE(back.channels() == 4);
  REQUIRE(back.at<cv::Vec4b>(0, 0) == cv::Vec4b(255, 0, 0, 128));

  const auto meta = nlohmann::json::parse(skydome::core::read_text(dir / "texture_metadata.json"));
  REQUIRE(meta["dimensions"][0] == 3);
  REQUIRE(meta["dimensions"][1] == 13);
  fs::remove_all(dir);
}

TEST_CASE("sky_map_written_to_disk") {
  const fs::path dir = scratch("skydome_test_skymap");
  const fs::path path = dir / "outputs" / "dome_sky_map.json";
  out::write_sky_map_json(coarse_grid(), CameraModel(), path);
  const auto doc = nlohmann::json::parse(skydome::core::read_text(path));
  REQUIRE(doc["metadata"]["grid_resolution_degrees"].get<double>() == Catch::Approx(30.0));
  fs::remove_all(dir);
}

TEST_CASE("unwritable_destination_throws_serialization_error") {
  const fs::path dir = scratch("skydome_test_unwritable");
  fs::create_directories(dir);
  const fs::path blocker = dir / "blocker";
  skydome::core::write_text(blocker, "file, not a directory");

  REQUIRE_THROWS_AS(out::write_dome_ply(coarse_grid(), blocker / "dome_sky_model.ply"),
                    skydome::SerializationError);
  REQUIRE_THROWS_AS(out::write_sky_map_json(coarse_grid(), CameraModel(), blocker / "map.json"),
                    skydome::SerializationError);
  fs::remove_all(dir);
}

TEST_CASE("classify_cell_reads_grid_state") {
  const DomeGrid grid = coarse_grid();
  REQUIRE(out::classify_cell(grid, 0, 0) == CellClass::SKY);
  REQUIRE(out::classify_cell(grid, 1, 2) == CellClass::NOT_SKY);
  REQUIRE(out::classify_cell(grid, 2, 12) == CellClass::UNSAMPLED);
}
