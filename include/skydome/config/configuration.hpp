#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace skydome::config {

namespace fs = std::filesystem;

// Capture device. Fixed per phone model.
struct CameraConfig {
  int image_width = 1864;
  int image_height = 4032;
  double fov_degrees = 75.0; // horizontal
};

struct DomeConfig {
  double resolution_degrees = 1.0;
  double theta_min_degrees = 0.0;  // zenith
  double theta_max_degrees = 60.0; // dome cap
};

struct SegmentationConfig {
  int bilateral_diameter = 9;
  double bilateral_sigma_color = 75.0;
  double bilateral_sigma_space = 75.0;
  int sobel_ksize = 3;
  double edge_threshold = 20.0;
  int edge_close_kernel = 3;
  int adaptive_block_size = 21;
  double adaptive_c = 2.0;
  double min_contour_area = 8000.0;
  double max_contour_area = 0.0; // 0 = no upper bound
  double top_fraction = 0.2;     // bbox top must lie above this share of the height
  double min_aspect_ratio = 1.0;
  double min_smoothness = 0.5;
  int open_kernel = 35;
};

struct AggregationConfig {
  int sample_step = 20;
  int sky_threshold = 128;
  std::string mode = "sequential"; // sequential | message_passing
  int channel_capacity = 8;
};

struct RuntimeConfig {
  int parallel_workers = 4;
  int min_usable_masks = 1;
};

struct OutputConfig {
  std::string masks_dir = "masks";
  std::string map_dir = "outputs";
  std::string model_dir = "model";
  std::string texture_dir = "outputs";
  std::string mask_extension = "png";
  double mesh_radius = 50.0;
};

struct Config {
  CameraConfig camera;
  DomeConfig dome;
  SegmentationConfig segmentation;
  AggregationConfig aggregation;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace skydome::config
