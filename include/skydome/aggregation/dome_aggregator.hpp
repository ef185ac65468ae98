#pragma once

#include "skydome/core/types.hpp"
#include "skydome/geometry/camera_model.hpp"
#include "skydome/geometry/dome_grid.hpp"

#include <opencv2/core.hpp>

namespace skydome::aggregation {

struct AggregationParams {
    int sample_step = 20;    // pixel stride in both image axes
    int sky_threshold = 128; // mask value above this is sky
};

/**
 * Projects sky masks onto a DomeGrid it does not own.
 *
 * project_photo() is const and touches no shared state, so any number of
 * threads may call it. Everything that mutates the grid (process_photo,
 * apply) must come from a single writer.
 */
class DomeAggregator {
public:
    DomeAggregator(geometry::DomeGrid& grid, const geometry::CameraModel& camera,
                   const AggregationParams& params = AggregationParams());

    SampleBatch project_photo(const PhotoRecord& record, const cv::Mat& mask) const;

    // Project and accumulate. False (grid unchanged) when anything fails.
    bool process_photo(const PhotoRecord& record, const cv::Mat& mask);

    // As process_photo, reading the mask from disk first.
    bool process_photo_file(const PhotoRecord& record, const fs::path& mask_path);

    void apply(const SampleBatch& batch);

    CoverageStats coverage_statistics() const { return grid_.coverage_statistics(); }

    const geometry::DomeGrid& grid() const { return grid_; }
    const geometry::CameraModel& camera() const { return camera_; }
    const AggregationParams& params() const { return params_; }

private:
    geometry::DomeGrid& grid_;
    geometry::CameraModel camera_;
    AggregationParams params_;
};

void log_projection_stats(const PhotoProjectionStats& stats);

} // namespace skydome::aggregation
