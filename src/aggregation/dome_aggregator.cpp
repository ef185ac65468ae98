#include "skydome/aggregation/dome_aggregator.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/io/image_io.hpp"

#include <iomanip>
#include <iostream>

namespace skydome::aggregation {

DomeAggregator::DomeAggregator(geometry::DomeGrid& grid, const geometry::CameraModel& camera,
                               const AggregationParams& params)
    : grid_(grid), camera_(camera), params_(params) {
    if (params.sample_step < 1) {
        throw ValidationError("sample_step must be >= 1");
    }
}

SampleBatch DomeAggregator::project_photo(const PhotoRecord& record, const cv::Mat& mask) const {
    if (mask.empty()) {
        throw DecodeError("empty mask for photo " + std::to_string(record.index));
    }
    if (mask.type() != CV_8UC1) {
        throw DecodeError("mask for photo " + std::to_string(record.index) +
                          " is not 8-bit single-channel");
    }

    const int width = camera_.intrinsics().width;
    const int height = camera_.intrinsics().height;
    if (mask.rows < height || mask.cols < width) {
        throw DecodeError("mask for photo " + std::to_string(record.index) + " is " +
                          std::to_string(mask.cols) + "x" + std::to_string(mask.rows) +
                          ", smaller than the " + std::to_string(width) + "x" +
                          std::to_string(height) + " camera frame");
    }

    const RotationMatrix rotation =
        geometry::euler_to_rotation(record.alpha, record.beta, record.gamma);
    const int step = params_.sample_step;

    SampleBatch batch;
    batch.index = record.index;
    batch.stats.index = record.index;

    for (int v = 0; v < height; v += step) {
        for (int u = 0; u < width; u += step) {
            ++batch.stats.pixels_sampled;

            auto sc = camera_.pixel_to_spherical(u, v, rotation);
            if (!sc) {
                continue;
            }
            auto cell = grid_.spherical_to_grid_index(sc->theta, sc->phi);
            if (!cell) {
                continue;
            }
            ++batch.stats.pixels_mapped;
            const bool sky = mask.at<uint8_t>(v, u) > params_.sky_threshold;
            if (sky) {
                ++batch.stats.sky_samples;
            }
            batch.samples.push_back({cell->theta_idx, cell->phi_idx, sky});
        }
    }

    const auto& st = batch.stats;
    batch.stats.coverage_percent =
        st.pixels_sampled > 0 ? 100.0 * st.pixels_mapped / st.pixels_sampled : 0.0;
    batch.stats.sky_percent =
        st.pixels_mapped > 0 ? 100.0 * st.sky_samples / st.pixels_mapped : 0.0;
    return batch;
}

void DomeAggregator::apply(const SampleBatch& batch) {
    grid_.apply(batch);
}

bool DomeAggregator::process_photo(const PhotoRecord& record, const cv::Mat& mask) {
    try {
        SampleBatch batch = project_photo(record, mask);
        apply(batch);
        log_projection_stats(batch.stats);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[AGG] photo " << record.index << " failed: " << e.what() << std::endl;
        return false;
    }
}

bool DomeAggregator::process_photo_file(const PhotoRecord& record, const fs::path& mask_path) {
    cv::Mat mask;
    try {
        mask = io::read_mask(mask_path);
    } catch (const IOError& e) {
        std::cerr << "[AGG] photo " << record.index << ": " << e.what() << std::endl;
        return false;
    }
    return process_photo(record, mask);
}

void log_projection_stats(const PhotoProjectionStats& stats) {
    std::cout << "[AGG] photo " << stats.index << ": " << stats.pixels_mapped << "/"
              << stats.pixels_sampled << " pixels mapped (" << std::fixed
              << std::setprecision(1) << stats.coverage_percent << "%), "
              << stats.sky_samples << " sky samples (" << stats.sky_percent << "%)"
              << std::defaultfloat << std::endl;
}

} // namespace skydome::aggregation
