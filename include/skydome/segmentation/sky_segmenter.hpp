#pragma once

#include "skydome/config/configuration.hpp"
#include "skydome/core/types.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace skydome::segmentation {

// Shape descriptors of one candidate region.
struct ContourShape {
    double area = 0.0;
    cv::Rect bbox;
    double aspect_ratio = 0.0;  // bbox width / height
    double hull_area = 0.0;
    double smoothness = 1.0;    // area / hull_area, 1 when the hull is degenerate
};

struct SegmentationSummary {
    int width = 0;
    int height = 0;
    int candidate_regions = 0;
    int accepted_regions = 0;
    double sky_fraction = 0.0;
};

cv::Mat to_gray(const cv::Mat& image);

// Edge map (255 = edge) from a bilateral-smoothed gradient magnitude,
// closed with one dilation and one erosion.
cv::Mat detect_sky_edges(const cv::Mat& image, const config::SegmentationConfig& cfg);

// Locally bright pixels (255) from a Gaussian adaptive threshold.
cv::Mat adaptive_brightness_mask(const cv::Mat& image, const config::SegmentationConfig& cfg);

ContourShape describe_contour(const std::vector<cv::Point>& contour);

// Sky acceptance predicate: large, near the top of the frame, wide and convex.
bool is_sky_contour(const ContourShape& shape, int image_height,
                    const config::SegmentationConfig& cfg);

// Keep only external contours of `candidates` that pass is_sky_contour,
// drawn filled into a fresh mask.
cv::Mat filter_sky_contours(const cv::Mat& candidates, int image_height,
                            const config::SegmentationConfig& cfg,
                            SegmentationSummary* summary = nullptr);

// Morphological opening that removes residual specks.
cv::Mat refine_sky_mask(const cv::Mat& mask, const config::SegmentationConfig& cfg);

// Full chain: image -> binary sky mask (255 sky, 0 not sky). Deterministic.
cv::Mat segment_sky(const cv::Mat& image,
                    const config::SegmentationConfig& cfg = config::SegmentationConfig(),
                    SegmentationSummary* summary = nullptr);

// Read a photo, segment it and write its mask.
SegmentationSummary segment_sky_file(const fs::path& photo_path, const fs::path& mask_path,
                                     const config::SegmentationConfig& cfg);

} // namespace skydome::segmentation
