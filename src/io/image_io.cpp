#include "skydome/io/image_io.hpp"
#include "skydome/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>

namespace skydome::io {

namespace {

cv::Mat read_image(const fs::path& path, int flags, const char* what) {
    if (!fs::exists(path)) {
        throw InputMissingError(std::string(what) + " not found: " + path.string());
    }
    cv::Mat img;
    try {
        img = cv::imread(path.string(), flags);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("cannot decode ") + what + " " + path.string() +
                          ": " + e.what());
    }
    if (img.empty()) {
        throw DecodeError(std::string("cannot decode ") + what + ": " + path.string());
    }
    return img;
}

} // namespace

cv::Mat read_color_image(const fs::path& path) {
    return read_image(path, cv::IMREAD_COLOR, "photo");
}

cv::Mat read_mask(const fs::path& path) {
    return read_image(path, cv::IMREAD_GRAYSCALE, "mask");
}

void write_mask(const fs::path& path, const cv::Mat& mask) {
    if (mask.empty() || mask.type() != CV_8UC1) {
        throw SerializationError("mask must be a non-empty 8-bit single-channel image: " +
                                 path.string());
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw SerializationError("cannot create " + path.parent_path().string() + ": " +
                                     ec.message());
        }
    }
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), mask);
    } catch (const cv::Exception& e) {
        throw SerializationError("cannot encode mask " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw SerializationError("cannot write mask: " + path.string());
    }
}

fs::path mask_path_for(const fs::path& masks_dir, int index, const std::string& extension) {
    return masks_dir / (std::to_string(index) + "." + extension);
}

} // namespace skydome::io
