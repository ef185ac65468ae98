#pragma once

#include "skydome/core/types.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace skydome::io {

// 8-bit BGR photo. Throws InputMissingError / DecodeError.
cv::Mat read_color_image(const fs::path& path);

// 8-bit single-channel mask. Throws InputMissingError / DecodeError.
cv::Mat read_mask(const fs::path& path);

// Throws SerializationError when the encoder or the file system refuses.
void write_mask(const fs::path& path, const cv::Mat& mask);

// masks_dir / "<index>.<extension>"
fs::path mask_path_for(const fs::path& masks_dir, int index, const std::string& extension);

} // namespace skydome::io
