#include "skydome/config/configuration.hpp"
#include "skydome/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace skydome::config {

static bool is_odd(int v) {
    return (v % 2) != 0;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["camera"]) {
            auto c = node["camera"];
            if (c["image_width"]) cfg.camera.image_width = c["image_width"].as<int>();
            if (c["image_height"]) cfg.camera.image_height = c["image_height"].as<int>();
            if (c["fov_degrees"]) cfg.camera.fov_degrees = c["fov_degrees"].as<double>();
        }

        if (node["dome"]) {
            auto d = node["dome"];
            if (d["resolution_degrees"]) cfg.dome.resolution_degrees = d["resolution_degrees"].as<double>();
            if (d["theta_min_degrees"]) cfg.dome.theta_min_degrees = d["theta_min_degrees"].as<double>();
            if (d["theta_max_degrees"]) cfg.dome.theta_max_degrees = d["theta_max_degrees"].as<double>();
        }

        if (node["segmentation"]) {
            auto s = node["segmentation"];
            if (s["bilateral_diameter"]) cfg.segmentation.bilateral_diameter = s["bilateral_diameter"].as<int>();
            if (s["bilateral_sigma_color"]) cfg.segmentation.bilateral_sigma_color = s["bilateral_sigma_color"].as<double>();
            if (s["bilateral_sigma_space"]) cfg.segmentation.bilateral_sigma_space = s["bilateral_sigma_space"].as<double>();
            if (s["sobel_ksize"]) cfg.segmentation.sobel_ksize = s["sobel_ksize"].as<int>();
            if (s["edge_threshold"]) cfg.segmentation.edge_threshold = s["edge_threshold"].as<double>();
            if (s["edge_close_kernel"]) cfg.segmentation.edge_close_kernel = s["edge_close_kernel"].as<int>();
            if (s["adaptive_block_size"]) cfg.segmentation.adaptive_block_size = s["adaptive_block_size"].as<int>();
            if (s["adaptive_c"]) cfg.segmentation.adaptive_c = s["adaptive_c"].as<double>();
            if (s["min_contour_area"]) cfg.segmentation.min_contour_area = s["min_contour_area"].as<double>();
            if (s["max_contour_area"]) cfg.segmentation.max_contour_area = s["max_contour_area"].as<double>();
            if (s["top_fraction"]) cfg.segmentation.top_fraction = s["top_fraction"].as<double>();
            if (s["min_aspect_ratio"]) cfg.segmentation.min_aspect_ratio = s["min_aspect_ratio"].as<double>();
            if (s["min_smoothness"]) cfg.segmentation.min_smoothness = s["min_smoothness"].as<double>();
            if (s["open_kernel"]) cfg.segmentation.open_kernel = s["open_kernel"].as<int>();
        }

        if (node["aggregation"]) {
            auto a = node["aggregation"];
            if (a["sample_step"]) cfg.aggregation.sample_step = a["sample_step"].as<int>();
            if (a["sky_threshold"]) cfg.aggregation.sky_threshold = a["sky_threshold"].as<int>();
            if (a["mode"]) cfg.aggregation.mode = a["mode"].as<std::string>();
            if (a["channel_capacity"]) cfg.aggregation.channel_capacity = a["channel_capacity"].as<int>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
            if (r["min_usable_masks"]) cfg.runtime.min_usable_masks = r["min_usable_masks"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["masks_dir"]) cfg.output.masks_dir = o["masks_dir"].as<std::string>();
            if (o["map_dir"]) cfg.output.map_dir = o["map_dir"].as<std::string>();
            if (o["model_dir"]) cfg.output.model_dir = o["model_dir"].as<std::string>();
            if (o["texture_dir"]) cfg.output.texture_dir = o["texture_dir"].as<std::string>();
            if (o["mask_extension"]) cfg.output.mask_extension = o["mask_extension"].as<std::string>();
            if (o["mesh_radius"]) cfg.output.mesh_radius = o["mesh_radius"].as<double>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["camera"]["image_width"] = camera.image_width;
    node["camera"]["image_height"] = camera.image_height;
    node["camera"]["fov_degrees"] = camera.fov_degrees;

    node["dome"]["resolution_degrees"] = dome.resolution_degrees;
    node["dome"]["theta_min_degrees"] = dome.theta_min_degrees;
    node["dome"]["theta_max_degrees"] = dome.theta_max_degrees;

    node["segmentation"]["bilateral_diameter"] = segmentation.bilateral_diameter;
    node["segmentation"]["bilateral_sigma_color"] = segmentation.bilateral_sigma_color;
    node["segmentation"]["bilateral_sigma_space"] = segmentation.bilateral_sigma_space;
    node["segmentation"]["sobel_ksize"] = segmentation.sobel_ksize;
    node["segmentation"]["edge_threshold"] = segmentation.edge_threshold;
    node["segmentation"]["edge_close_kernel"] = segmentation.edge_close_kernel;
    node["segmentation"]["adaptive_block_size"] = segmentation.adaptive_block_size;
    node["segmentation"]["adaptive_c"] = segmentation.adaptive_c;
    node["segmentation"]["min_contour_area"] = segmentation.min_contour_area;
    node["segmentation"]["max_contour_area"] = segmentation.max_contour_area;
    node["segmentation"]["top_fraction"] = segmentation.top_fraction;
    node["segmentation"]["min_aspect_ratio"] = segmentation.min_aspect_ratio;
    node["segmentation"]["min_smoothness"] = segmentation.min_smoothness;
    node["segmentation"]["open_kernel"] = segmentation.open_kernel;

    node["aggregation"]["sample_step"] = aggregation.sample_step;
    node["aggregation"]["sky_threshold"] = aggregation.sky_threshold;
    node["aggregation"]["mode"] = aggregation.mode;
    node["aggregation"]["channel_capacity"] = aggregation.channel_capacity;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["min_usable_masks"] = runtime.min_usable_masks;

    node["output"]["masks_dir"] = output.masks_dir;
    node["output"]["map_dir"] = output.map_dir;
    node["output"]["model_dir"] = output.model_dir;
    node["output"]["texture_dir"] = output.texture_dir;
    node["output"]["mask_extension"] = output.mask_extension;
    node["output"]["mesh_radius"] = output.mesh_radius;

    return node;
}

void Config::validate() const {
    if (camera.image_width < 1 || camera.image_height < 1) {
        throw ValidationError("camera.image_width and camera.image_height must be >= 1");
    }
    if (!(camera.fov_degrees > 0.0 && camera.fov_degrees < 180.0)) {
        throw ValidationError("camera.fov_degrees must be in (0, 180)");
    }

    if (!std::isfinite(dome.resolution_degrees) || dome.resolution_degrees <= 0.0) {
        throw ValidationError("dome.resolution_degrees must be > 0");
    }
    if (dome.theta_min_degrees < 0.0 || dome.theta_max_degrees > 180.0 ||
        dome.theta_min_degrees >= dome.theta_max_degrees) {
        throw ValidationError("dome theta range must satisfy 0 <= theta_min < theta_max <= 180");
    }

    if (segmentation.bilateral_diameter < 1) {
        throw ValidationError("segmentation.bilateral_diameter must be >= 1");
    }
    if (segmentation.sobel_ksize != 1 && segmentation.sobel_ksize != 3 &&
        segmentation.sobel_ksize != 5 && segmentation.sobel_ksize != 7) {
        throw ValidationError("segmentation.sobel_ksize must be 1, 3, 5 or 7");
    }
    if (segmentation.edge_close_kernel < 1) {
        throw ValidationError("segmentation.edge_close_kernel must be >= 1");
    }
    if (segmentation.adaptive_block_size < 3 || !is_odd(segmentation.adaptive_block_size)) {
        throw ValidationError("segmentation.adaptive_block_size must be odd and >= 3");
    }
    if (segmentation.min_contour_area < 0.0) {
        throw ValidationError("segmentation.min_contour_area must be >= 0");
    }
    if (segmentation.max_contour_area < 0.0 ||
        (segmentation.max_contour_area > 0.0 &&
         segmentation.max_contour_area <= segmentation.min_contour_area)) {
        throw ValidationError("segmentation.max_contour_area must be 0 or > min_contour_area");
    }
    if (segmentation.top_fraction <= 0.0 || segmentation.top_fraction > 1.0) {
        throw ValidationError("segmentation.top_fraction must be in (0, 1]");
    }
    if (segmentation.min_smoothness < 0.0 || segmentation.min_smoothness > 1.0) {
        throw ValidationError("segmentation.min_smoothness must be in [0, 1]");
    }
    if (segmentation.open_kernel < 1) {
        throw ValidationError("segmentation.open_kernel must be >= 1");
    }

    if (aggregation.sample_step < 1) {
        throw ValidationError("aggregation.sample_step must be >= 1");
    }
    if (aggregation.sky_threshold < 0 || aggregation.sky_threshold > 254) {
        throw ValidationError("aggregation.sky_threshold must be in [0, 254]");
    }
    if (aggregation.mode != "sequential" && aggregation.mode != "message_passing") {
        throw ValidationError("aggregation.mode must be 'sequential' or 'message_passing'");
    }
    if (aggregation.channel_capacity < 1) {
        throw ValidationError("aggregation.channel_capacity must be >= 1");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }
    if (runtime.min_usable_masks < 1) {
        throw ValidationError("runtime.min_usable_masks must be >= 1");
    }

    if (output.masks_dir.empty() || output.map_dir.empty() ||
        output.model_dir.empty() || output.texture_dir.empty()) {
        throw ValidationError("output directories must not be empty");
    }
    if (output.mask_extension != "png" && output.mask_extension != "jpg" &&
        output.mask_extension != "bmp" && output.mask_extension != "tif") {
        throw ValidationError("output.mask_extension must be png, jpg, bmp or tif");
    }
    if (!(output.mesh_radius > 0.0)) {
        throw ValidationError("output.mesh_radius must be > 0");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "camera": {
      "type": "object",
      "properties": {
        "image_width": {"type": "integer", "minimum": 1},
        "image_height": {"type": "integer", "minimum": 1},
        "fov_degrees": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 180}
      }
    },
    "dome": {
      "type": "object",
      "properties": {
        "resolution_degrees": {"type": "number", "exclusiveMinimum": 0},
        "theta_min_degrees": {"type": "number", "minimum": 0, "maximum": 180},
        "theta_max_degrees": {"type": "number", "minimum": 0, "maximum": 180}
      }
    },
    "segmentation": {
      "type": "object",
      "properties": {
        "bilateral_diameter": {"type": "integer", "minimum": 1},
        "bilateral_sigma_color": {"type": "number"},
        "bilateral_sigma_space": {"type": "number"},
        "sobel_ksize": {"type": "integer", "enum": [1, 3, 5, 7]},
        "edge_threshold": {"type": "number"},
        "edge_close_kernel": {"type": "integer", "minimum": 1},
        "adaptive_block_size": {"type": "integer", "minimum": 3},
        "adaptive_c": {"type": "number"},
        "min_contour_area": {"type": "number", "minimum": 0},
        "max_contour_area": {"type": "number", "minimum": 0},
        "top_fraction": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "min_aspect_ratio": {"type": "number"},
        "min_smoothness": {"type": "number", "minimum": 0, "maximum": 1},
        "open_kernel": {"type": "integer", "minimum": 1}
      }
    },
    "aggregation": {
      "type": "object",
      "properties": {
        "sample_step": {"type": "integer", "minimum": 1},
        "sky_threshold": {"type": "integer", "minimum": 0, "maximum": 254},
        "mode": {"type": "string", "enum": ["sequential", "message_passing"]},
        "channel_capacity": {"type": "integer", "minimum": 1}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1},
        "min_usable_masks": {"type": "integer", "minimum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "masks_dir": {"type": "string"},
        "map_dir": {"type": "string"},
        "model_dir": {"type": "string"},
        "texture_dir": {"type": "string"},
        "mask_extension": {"type": "string", "enum": ["png", "jpg", "bmp", "tif"]},
        "mesh_radius": {"type": "number", "exclusiveMinimum": 0}
      }
    }
  }
})";
}

} // namespace skydome::config
