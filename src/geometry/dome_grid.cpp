#include "skydome/geometry/dome_grid.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/core/utils.hpp"

#include <cmath>

namespace skydome::geometry {

namespace {

// Ranges that are exact multiples of the resolution land a hair below the
// integer in floating point (pi/3 / 1deg = 59.999...); snap those up.
constexpr double kStepEpsilon = 1e-9;

int steps_for(double range, double resolution) {
    return static_cast<int>(std::floor(range / resolution + kStepEpsilon)) + 1;
}

} // namespace

DomeGrid::DomeGrid(const DomeGridSpec& spec) : spec_(spec) {
    if (!std::isfinite(spec.resolution_degrees) || spec.resolution_degrees <= 0.0) {
        throw ValidationError("dome grid resolution must be a positive number of degrees");
    }
    if (!(spec.theta_max > spec.theta_min) || !(spec.phi_max > spec.phi_min)) {
        throw ValidationError("dome grid angular ranges must be non-empty");
    }
    resolution_ = core::deg_to_rad(spec.resolution_degrees);
    theta_steps_ = steps_for(spec.theta_max - spec.theta_min, resolution_);
    phi_steps_ = steps_for(spec.phi_max - spec.phi_min, resolution_);

    const size_t n = static_cast<size_t>(total_cells());
    sky_.assign(n, 0);
    counts_.assign(n, 0);
}

std::optional<GridIndex> DomeGrid::spherical_to_grid_index(double theta, double phi) const {
    if (!std::isfinite(theta) || !std::isfinite(phi)) {
        return std::nullopt;
    }
    const double ti = std::floor((theta - spec_.theta_min) / resolution_);
    const double pj = std::floor((phi - spec_.phi_min) / resolution_);
    if (ti < 0.0 || ti >= theta_steps_ || pj < 0.0 || pj >= phi_steps_) {
        return std::nullopt;
    }
    return GridIndex{static_cast<int>(ti), static_cast<int>(pj)};
}

SphericalCoord DomeGrid::cell_center(int theta_idx, int phi_idx) const {
    return {spec_.theta_min + (theta_idx + 0.5) * resolution_,
            spec_.phi_min + (phi_idx + 0.5) * resolution_};
}

SphericalCoord DomeGrid::cell_vertex_angles(int theta_idx, int phi_idx) const {
    return {spec_.theta_min + theta_idx * resolution_,
            spec_.phi_min + phi_idx * resolution_};
}

size_t DomeGrid::offset(int theta_idx, int phi_idx) const {
    if (theta_idx < 0 || theta_idx >= theta_steps_ || phi_idx < 0 || phi_idx >= phi_steps_) {
        throw ValidationError("grid index (" + std::to_string(theta_idx) + ", " +
                              std::to_string(phi_idx) + ") out of range");
    }
    return static_cast<size_t>(theta_idx) * static_cast<size_t>(phi_steps_) +
           static_cast<size_t>(phi_idx);
}

bool DomeGrid::is_sky(int theta_idx, int phi_idx) const {
    return sky_[offset(theta_idx, phi_idx)] != 0;
}

uint32_t DomeGrid::sample_count(int theta_idx, int phi_idx) const {
    return counts_[offset(theta_idx, phi_idx)];
}

CellClass DomeGrid::classify(int theta_idx, int phi_idx) const {
    const size_t k = offset(theta_idx, phi_idx);
    if (counts_[k] == 0) {
        return CellClass::UNSAMPLED;
    }
    return sky_[k] ? CellClass::SKY : CellClass::NOT_SKY;
}

void DomeGrid::add_sample(int theta_idx, int phi_idx, bool is_sky) {
    const size_t k = offset(theta_idx, phi_idx);
    counts_[k] += 1;
    if (is_sky) {
        sky_[k] = 1;
    }
}

void DomeGrid::apply(const SampleBatch& batch) {
    // Validate first so a bad batch leaves the grid untouched.
    for (const auto& s : batch.samples) {
        offset(s.theta_idx, s.phi_idx);
    }
    for (const auto& s : batch.samples) {
        add_sample(s.theta_idx, s.phi_idx, s.is_sky);
    }
}

CoverageStats DomeGrid::coverage_statistics() const {
    CoverageStats st;
    st.total_cells = total_cells();
    for (size_t k = 0; k < counts_.size(); ++k) {
        if (counts_[k] > 0) {
            ++st.sampled_cells;
        }
        if (sky_[k]) {
            ++st.sky_cells;
        }
    }
    st.not_sky_cells = st.sampled_cells - st.sky_cells;
    st.unsampled_cells = st.total_cells - st.sampled_cells;

    const double total = static_cast<double>(st.total_cells);
    const double sampled = static_cast<double>(st.sampled_cells);
    st.coverage_percent = total > 0 ? 100.0 * sampled / total : 0.0;
    st.unsampled_percent = total > 0 ? 100.0 * st.unsampled_cells / total : 0.0;
    st.sky_percent = sampled > 0 ? 100.0 * st.sky_cells / sampled : 0.0;
    st.not_sky_percent = sampled > 0 ? 100.0 * st.not_sky_cells / sampled : 0.0;
    return st;
}

bool DomeGrid::equals(const DomeGrid& other) const {
    return theta_steps_ == other.theta_steps_ && phi_steps_ == other.phi_steps_ &&
           sky_ == other.sky_ && counts_ == other.counts_;
}

} // namespace skydome::geometry
