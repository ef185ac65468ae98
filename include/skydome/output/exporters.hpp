#pragma once

#include "skydome/core/types.hpp"
#include "skydome/geometry/camera_model.hpp"
#include "skydome/geometry/dome_grid.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace skydome::output {

using Rgba = std::array<uint8_t, 4>;

// Legend shared by mesh and texture: gray unsampled, blue sky, red not sky,
// all at alpha 128.
Rgba class_color(CellClass c);

CellClass classify_cell(const geometry::DomeGrid& grid, int theta_idx, int phi_idx);

nlohmann::json coverage_to_json(const CoverageStats& stats);

nlohmann::json sky_map_metadata(const geometry::DomeGrid& grid,
                                const geometry::CameraModel& camera);

nlohmann::json build_sky_map(const geometry::DomeGrid& grid,
                             const geometry::CameraModel& camera,
                             const nlohmann::json& provenance = nlohmann::json::object());

// dome_sky_map.json
void write_sky_map_json(const geometry::DomeGrid& grid, const geometry::CameraModel& camera,
                        const fs::path& path,
                        const nlohmann::json& provenance = nlohmann::json::object());

struct DomeMesh {
    std::vector<std::array<float, 3>> vertices;  // one per cell, row-major
    std::vector<Rgba> colors;
    std::vector<std::array<int, 3>> faces;
};

// Vertex (i, j) sits on a sphere of `radius` at the cell's lower-corner
// angles. Quads between adjacent theta rows and azimuth columns become two
// triangles. No face joins the last column back to column 0; both share the
// same position at phi = 2*pi, so the ring is closed without degenerate faces.
DomeMesh build_dome_mesh(const geometry::DomeGrid& grid, double radius);

// dome_sky_model.ply, ASCII with per-vertex RGBA.
void write_dome_ply(const geometry::DomeGrid& grid, const fs::path& path, double radius = 50.0);

// theta_steps x phi_steps RGBA texture, stored in OpenCV channel order (BGRA).
cv::Mat build_data_texture(const geometry::DomeGrid& grid);

nlohmann::json texture_metadata(const geometry::DomeGrid& grid);

// dome_sky_texture.png plus texture_metadata.json beside it.
void write_data_texture(const geometry::DomeGrid& grid, const fs::path& texture_path,
                        const fs::path& metadata_path);

} // namespace skydome::output
