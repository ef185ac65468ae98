#pragma once

#include "skydome/core/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace skydome::geometry {

// Angular extent and resolution of a dome grid. Angles in radians.
struct DomeGridSpec {
    double resolution_degrees = 1.0;
    double theta_min = 0.0;
    double theta_max = 1.0471975511965976;  // pi / 3
    double phi_min = 0.0;
    double phi_max = 6.283185307179586;     // 2 * pi
};

/**
 * Sky-visibility accumulator over the dome cap.
 *
 * Cells are addressed (theta_idx, phi_idx) and stored in flat row-major
 * arrays (theta_idx * phi_steps + phi_idx). The shape is fixed at
 * construction. The only mutators increment sample counts and OR the sky
 * flags, so counts never decrease and a sky cell never reverts.
 */
class DomeGrid {
public:
    explicit DomeGrid(const DomeGridSpec& spec = DomeGridSpec());

    const DomeGridSpec& spec() const { return spec_; }
    double resolution_radians() const { return resolution_; }
    int theta_steps() const { return theta_steps_; }
    int phi_steps() const { return phi_steps_; }
    int64_t total_cells() const {
        return static_cast<int64_t>(theta_steps_) * static_cast<int64_t>(phi_steps_);
    }

    std::optional<GridIndex> spherical_to_grid_index(double theta, double phi) const;

    // Center of a cell; maps back to the same index.
    SphericalCoord cell_center(int theta_idx, int phi_idx) const;
    // Lower corner of a cell, used as the mesh vertex position.
    SphericalCoord cell_vertex_angles(int theta_idx, int phi_idx) const;

    bool is_sky(int theta_idx, int phi_idx) const;
    uint32_t sample_count(int theta_idx, int phi_idx) const;
    CellClass classify(int theta_idx, int phi_idx) const;

    const std::vector<uint8_t>& sky_flags() const { return sky_; }
    const std::vector<uint32_t>& sample_counts() const { return counts_; }

    void add_sample(int theta_idx, int phi_idx, bool is_sky);
    void apply(const SampleBatch& batch);

    CoverageStats coverage_statistics() const;

    bool equals(const DomeGrid& other) const;

private:
    size_t offset(int theta_idx, int phi_idx) const;

    DomeGridSpec spec_;
    double resolution_;
    int theta_steps_;
    int phi_steps_;
    std::vector<uint8_t> sky_;
    std::vector<uint32_t> counts_;
};

} // namespace skydome::geometry
