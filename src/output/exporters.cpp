#include "skydome/output/exporters.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cmath>
#include <fstream>
#include <iostream>

namespace skydome::output {

using json = nlohmann::json;

namespace {

void ensure_parent_dir(const fs::path& path) {
    if (!path.has_parent_path()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw SerializationError("cannot create " + path.parent_path().string() + ": " +
                                 ec.message());
    }
}

void write_json_file(const fs::path& path, const json& doc) {
    ensure_parent_dir(path);
    core::write_text(path, doc.dump(2));
}

} // namespace

Rgba class_color(CellClass c) {
    switch (c) {
        case CellClass::SKY: return {0, 0, 255, 128};
        case CellClass::NOT_SKY: return {255, 0, 0, 128};
        case CellClass::UNSAMPLED:
        default: return {128, 128, 128, 128};
    }
}

CellClass classify_cell(const geometry::DomeGrid& grid, int theta_idx, int phi_idx) {
    return grid.classify(theta_idx, phi_idx);
}

json coverage_to_json(const CoverageStats& stats) {
    return {
        {"total_cells", stats.total_cells},
        {"sampled_cells", stats.sampled_cells},
        {"sky_cells", stats.sky_cells},
        {"not_sky_cells", stats.not_sky_cells},
        {"unsampled_cells", stats.unsampled_cells},
        {"coverage_percent", stats.coverage_percent},
        {"sky_percent", stats.sky_percent},
        {"not_sky_percent", stats.not_sky_percent},
        {"unsampled_percent", stats.unsampled_percent}
    };
}

json sky_map_metadata(const geometry::DomeGrid& grid, const geometry::CameraModel& camera) {
    const auto& spec = grid.spec();
    json meta;
    meta["coordinate_system"] = "spherical_dome";
    meta["description"] = "Spherical dome from the zenith (theta = 0) down to the dome cap";
    meta["dome_center"] = "zero orientation points at the zenith";
    meta["theta_range_radians"] = {spec.theta_min, spec.theta_max};
    meta["phi_range_radians"] = {spec.phi_min, spec.phi_max};
    meta["theta_range_degrees"] = {core::rad_to_deg(spec.theta_min), core::rad_to_deg(spec.theta_max)};
    meta["phi_range_degrees"] = {core::rad_to_deg(spec.phi_min), core::rad_to_deg(spec.phi_max)};
    meta["grid_resolution_degrees"] = spec.resolution_degrees;
    meta["grid_dimensions"] = {grid.theta_steps(), grid.phi_steps()};
    meta["camera_fov_degrees"] = camera.intrinsics().fov_degrees;
    meta["image_dimensions"] = {camera.intrinsics().width, camera.intrinsics().height};
    meta["focal_length"] = camera.focal_length();
    meta["principal_point"] = {camera.cx(), camera.cy()};
    meta["rotation_mapping"] = {
        {"alpha", "yaw (Z-axis rotation)"},
        {"beta", "pitch (X-axis rotation)"},
        {"gamma", "roll (Y-axis rotation)"},
        {"composition", "R = Rz(alpha) * Ry(gamma) * Rx(beta)"}
    };
    meta["grid_values"] = {{"sky", true}, {"not_sky", false}};
    meta["color_scheme"] = {{"sky", "blue"}, {"not_sky", "red"}, {"unsampled", "gray"}};
    return meta;
}

json build_sky_map(const geometry::DomeGrid& grid, const geometry::CameraModel& camera,
                   const json& provenance) {
    json sky_rows = json::array();
    json count_rows = json::array();
    for (int i = 0; i < grid.theta_steps(); ++i) {
        json sky_row = json::array();
        json count_row = json::array();
        for (int j = 0; j < grid.phi_steps(); ++j) {
            sky_row.push_back(grid.is_sky(i, j));
            count_row.push_back(grid.sample_count(i, j));
        }
        sky_rows.push_back(std::move(sky_row));
        count_rows.push_back(std::move(count_row));
    }

    json meta = sky_map_metadata(grid, camera);
    for (auto& [key, value] : provenance.items()) {
        meta[key] = value;
    }

    return {
        {"sky_grid", std::move(sky_rows)},
        {"sample_counts", std::move(count_rows)},
        {"coverage", coverage_to_json(grid.coverage_statistics())},
        {"metadata", std::move(meta)}
    };
}

void write_sky_map_json(const geometry::DomeGrid& grid, const geometry::CameraModel& camera,
                        const fs::path& path, const json& provenance) {
    write_json_file(path, build_sky_map(grid, camera, provenance));
    std::cout << "[EXPORT] sky map: " << path.string() << std::endl;
}

DomeMesh build_dome_mesh(const geometry::DomeGrid& grid, double radius) {
    const int rows = grid.theta_steps();
    const int cols = grid.phi_steps();

    DomeMesh mesh;
    mesh.vertices.reserve(static_cast<size_t>(grid.total_cells()));
    mesh.colors.reserve(static_cast<size_t>(grid.total_cells()));

    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            const SphericalCoord a = grid.cell_vertex_angles(i, j);
            const double st = std::sin(a.theta);
            mesh.vertices.push_back({static_cast<float>(radius * st * std::cos(a.phi)),
                                     static_cast<float>(radius * st * std::sin(a.phi)),
                                     static_cast<float>(radius * std::cos(a.theta))});
            mesh.colors.push_back(class_color(classify_cell(grid, i, j)));
        }
    }

    // The last column lies at phi = 2*pi on top of column 0, so the strip
    // j = cols - 2 .. cols - 1 already closes the ring.
    if (rows > 1 && cols > 1) {
        mesh.faces.reserve(static_cast<size_t>(rows - 1) * static_cast<size_t>(cols - 1) * 2);
    }
    for (int i = 0; i + 1 < rows; ++i) {
        for (int j = 0; j + 1 < cols; ++j) {
            const int jn = j + 1;
            const int v0 = i * cols + j;
            const int v1 = i * cols + jn;
            const int v2 = (i + 1) * cols + j;
            const int v3 = (i + 1) * cols + jn;
            mesh.faces.push_back({v0, v1, v2});
            mesh.faces.push_back({v1, v3, v2});
        }
    }
    return mesh;
}

void write_dome_ply(const geometry::DomeGrid& grid, const fs::path& path, double radius) {
    const DomeMesh mesh = build_dome_mesh(grid, radius);

    ensure_parent_dir(path);
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw SerializationError("cannot open PLY for writing: " + path.string());
    }

    out << "ply\n";
    out << "format ascii 1.0\n";
    out << "comment skydome obstruction map\n";
    out << "element vertex " << mesh.vertices.size() << "\n";
    out << "property float x\n";
    out << "property float y\n";
    out << "property float z\n";
    out << "property uchar red\n";
    out << "property uchar green\n";
    out << "property uchar blue\n";
    out << "property uchar alpha\n";
    out << "element face " << mesh.faces.size() << "\n";
    out << "property list uchar int vertex_indices\n";
    out << "end_header\n";

    for (size_t k = 0; k < mesh.vertices.size(); ++k) {
        const auto& p = mesh.vertices[k];
        const auto& c = mesh.colors[k];
        out << p[0] << " " << p[1] << " " << p[2] << " "
            << static_cast<int>(c[0]) << " " << static_cast<int>(c[1]) << " "
            << static_cast<int>(c[2]) << " " << static_cast<int>(c[3]) << "\n";
    }
    for (const auto& f : mesh.faces) {
        out << "3 " << f[0] << " " << f[1] << " " << f[2] << "\n";
    }

    out.flush();
    if (!out) {
        throw SerializationError("failed writing PLY: " + path.string());
    }
    std::cout << "[EXPORT] dome mesh: " << path.string() << " (" << mesh.vertices.size()
              << " vertices, " << mesh.faces.size() << " faces)" << std::endl;
}

cv::Mat build_data_texture(const geometry::DomeGrid& grid) {
    cv::Mat tex(grid.theta_steps(), grid.phi_steps(), CV_8UC4);
    for (int i = 0; i < grid.theta_steps(); ++i) {
        for (int j = 0; j < grid.phi_steps(); ++j) {
            const Rgba c = class_color(classify_cell(grid, i, j));
            tex.at<cv::Vec4b>(i, j) = cv::Vec4b(c[2], c[1], c[0], c[3]);
        }
    }
    return tex;
}

json texture_metadata(const geometry::DomeGrid& grid) {
    const auto& spec = grid.spec();
    return {
        {"description", "Data texture for the spherical dome, rows = theta, columns = phi"},
        {"dimensions", {grid.theta_steps(), grid.phi_steps()}},
        {"theta_range_degrees", {core::rad_to_deg(spec.theta_min), core::rad_to_deg(spec.theta_max)}},
        {"phi_range_degrees", {core::rad_to_deg(spec.phi_min), core::rad_to_deg(spec.phi_max)}},
        {"grid_resolution_degrees", spec.resolution_degrees},
        {"color_mapping", {
            {"red", "not sky or obstruction"},
            {"blue", "sky"},
            {"gray", "unsampled"}
        }},
        {"alpha_channel", {{"128", "50% transparency (consistent across all colors)"}}},
        {"usage", "Use as a data texture for dome visualization"}
    };
}

void write_data_texture(const geometry::DomeGrid& grid, const fs::path& texture_path,
                        const fs::path& metadata_path) {
    const cv::Mat tex = build_data_texture(grid);

    ensure_parent_dir(texture_path);
    bool ok = false;
    try {
        ok = cv::imwrite(texture_path.string(), tex);
    } catch (const cv::Exception& e) {
        throw SerializationError("cannot encode texture " + texture_path.string() + ": " + e.what());
    }
    if (!ok) {
        throw SerializationError("cannot write texture: " + texture_path.string());
    }
    std::cout << "[EXPORT] data texture: " << texture_path.string() << std::endl;

    write_json_file(metadata_path, texture_metadata(grid));
    std::cout << "[EXPORT] texture metadata: " << metadata_path.string() << std::endl;
}

} // namespace skydome::output
