#include "skydome/segmentation/sky_segmenter.hpp"
#include "skydome/core/errors.hpp"
#include "skydome/io/image_io.hpp"

#include <opencv2/imgproc.hpp>

namespace skydome::segmentation {

cv::Mat to_gray(const cv::Mat& image) {
    if (image.empty()) {
        throw ValidationError("cannot segment an empty image");
    }
    if (image.depth() != CV_8U) {
        throw ValidationError("segmentation expects 8-bit images");
    }
    cv::Mat gray;
    switch (image.channels()) {
        case 1:
            gray = image;
            break;
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw ValidationError("unsupported channel count " + std::to_string(image.channels()));
    }
    return gray;
}

cv::Mat detect_sky_edges(const cv::Mat& image, const config::SegmentationConfig& cfg) {
    cv::Mat gray = to_gray(image);

    cv::Mat smoothed;
    cv::bilateralFilter(gray, smoothed, cfg.bilateral_diameter,
                        cfg.bilateral_sigma_color, cfg.bilateral_sigma_space);

    cv::Mat gx, gy, magnitude;
    cv::Sobel(smoothed, gx, CV_64F, 1, 0, cfg.sobel_ksize);
    cv::Sobel(smoothed, gy, CV_64F, 0, 1, cfg.sobel_ksize);
    cv::magnitude(gx, gy, magnitude);

    cv::Mat magnitude8;
    magnitude.convertTo(magnitude8, CV_8U);  // saturates above 255

    cv::Mat edges;
    cv::threshold(magnitude8, edges, cfg.edge_threshold, 255, cv::THRESH_BINARY);

    const cv::Mat kernel = cv::Mat::ones(cfg.edge_close_kernel, cfg.edge_close_kernel, CV_8U);
    cv::Mat dilated, closed;
    cv::dilate(edges, dilated, kernel, cv::Point(-1, -1), 1);
    cv::erode(dilated, closed, kernel, cv::Point(-1, -1), 1);
    return closed;
}

cv::Mat adaptive_brightness_mask(const cv::Mat& image, const config::SegmentationConfig& cfg) {
    cv::Mat gray = to_gray(image);
    cv::Mat mask;
    cv::adaptiveThreshold(gray, mask, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY,
                          cfg.adaptive_block_size, cfg.adaptive_c);
    return mask;
}

ContourShape describe_contour(const std::vector<cv::Point>& contour) {
    ContourShape s;
    s.area = cv::contourArea(contour);
    s.bbox = cv::boundingRect(contour);
    s.aspect_ratio = s.bbox.height > 0
                         ? static_cast<double>(s.bbox.width) / static_cast<double>(s.bbox.height)
                         : 0.0;

    std::vector<cv::Point> hull;
    cv::convexHull(contour, hull);
    s.hull_area = cv::contourArea(hull);
    s.smoothness = s.hull_area > 0.0 ? s.area / s.hull_area : 1.0;
    return s;
}

bool is_sky_contour(const ContourShape& shape, int image_height,
                    const config::SegmentationConfig& cfg) {
    if (!(shape.area > cfg.min_contour_area)) {
        return false;
    }
    if (cfg.max_contour_area > 0.0 && !(shape.area < cfg.max_contour_area)) {
        return false;
    }
    if (!(shape.bbox.y < image_height * cfg.top_fraction)) {
        return false;
    }
    return shape.aspect_ratio > cfg.min_aspect_ratio && shape.smoothness > cfg.min_smoothness;
}

cv::Mat filter_sky_contours(const cv::Mat& candidates, int image_height,
                            const config::SegmentationConfig& cfg,
                            SegmentationSummary* summary) {
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(candidates.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    cv::Mat sky = cv::Mat::zeros(candidates.size(), CV_8UC1);
    int accepted = 0;
    for (size_t i = 0; i < contours.size(); ++i) {
        const ContourShape shape = describe_contour(contours[i]);
        if (is_sky_contour(shape, image_height, cfg)) {
            cv::drawContours(sky, contours, static_cast<int>(i), cv::Scalar(255), cv::FILLED);
            ++accepted;
        }
    }

    if (summary) {
        summary->candidate_regions = static_cast<int>(contours.size());
        summary->accepted_regions = accepted;
    }
    return sky;
}

cv::Mat refine_sky_mask(const cv::Mat& mask, const config::SegmentationConfig& cfg) {
    const cv::Mat kernel = cv::Mat::ones(cfg.open_kernel, cfg.open_kernel, CV_8U);
    cv::Mat opened;
    cv::morphologyEx(mask, opened, cv::MORPH_OPEN, kernel);
    return opened;
}

cv::Mat segment_sky(const cv::Mat& image, const config::SegmentationConfig& cfg,
                    SegmentationSummary* summary) {
    const cv::Mat edges = detect_sky_edges(image, cfg);
    const cv::Mat bright = adaptive_brightness_mask(image, cfg);

    cv::Mat not_edges, combined;
    cv::bitwise_not(edges, not_edges);
    cv::bitwise_and(bright, not_edges, combined);

    SegmentationSummary local;
    cv::Mat sky = filter_sky_contours(combined, image.rows, cfg, &local);
    cv::Mat refined = refine_sky_mask(sky, cfg);

    if (summary) {
        local.width = image.cols;
        local.height = image.rows;
        const double n = static_cast<double>(refined.total());
        local.sky_fraction = n > 0 ? cv::countNonZero(refined) / n : 0.0;
        *summary = local;
    }
    return refined;
}

SegmentationSummary segment_sky_file(const fs::path& photo_path, const fs::path& mask_path,
                                     const config::SegmentationConfig& cfg) {
    const cv::Mat image = io::read_color_image(photo_path);
    SegmentationSummary summary;
    const cv::Mat mask = segment_sky(image, cfg, &summary);
    io::write_mask(mask_path, mask);
    return summary;
}

} // namespace skydome::segmentation
