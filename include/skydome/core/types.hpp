#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace skydome {

namespace fs = std::filesystem;

// Geometry types
using RotationMatrix = Eigen::Matrix3d;
using Vector3d = Eigen::Vector3d;

// One captured photo with the device orientation at capture time.
struct PhotoRecord {
    int index = 0;
    int64_t timestamp = 0;
    double alpha = 0.0;    // yaw (rad)
    double beta = 0.0;     // pitch (rad)
    double gamma = 0.0;    // roll (rad)
    std::string photo_uri;
};

// Spherical direction on the dome
struct SphericalCoord {
    double theta;  // colatitude, 0 = zenith
    double phi;    // azimuth in [0, 2*pi)
};

struct GridIndex {
    int theta_idx;
    int phi_idx;

    bool operator==(const GridIndex& o) const {
        return theta_idx == o.theta_idx && phi_idx == o.phi_idx;
    }
    bool operator!=(const GridIndex& o) const { return !(*this == o); }
};

// Cell classification used by every renderer
enum class CellClass {
    UNSAMPLED,
    SKY,
    NOT_SKY
};

// Coverage snapshot of a dome grid
struct CoverageStats {
    int64_t total_cells = 0;
    int64_t sampled_cells = 0;
    int64_t sky_cells = 0;
    int64_t not_sky_cells = 0;
    int64_t unsampled_cells = 0;
    double coverage_percent = 0.0;   // of total_cells
    double sky_percent = 0.0;        // of sampled_cells
    double not_sky_percent = 0.0;    // of sampled_cells
    double unsampled_percent = 0.0;  // of total_cells
};

// Per-photo projection counters (observability only)
struct PhotoProjectionStats {
    int index = 0;
    int pixels_sampled = 0;
    int pixels_mapped = 0;
    int sky_samples = 0;
    double coverage_percent = 0.0;
    double sky_percent = 0.0;
};

// One projected sample destined for a grid cell
struct CellSample {
    int theta_idx;
    int phi_idx;
    bool is_sky;
};

// All samples of one photo; the unit handed to the aggregator
struct SampleBatch {
    int index = 0;
    std::vector<CellSample> samples;
    PhotoProjectionStats stats;
};

struct BatchCounters {
    int total = 0;
    int success = 0;
    int failed = 0;
};

// Pipeline phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    SEGMENTATION = 1,
    AGGREGATION = 2,
    EXPORT = 3
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::SEGMENTATION: return "SEGMENTATION";
        case Phase::AGGREGATION: return "AGGREGATION";
        case Phase::EXPORT: return "EXPORT";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace skydome
