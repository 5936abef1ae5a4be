#pragma once

#include "flypath/core/types.hpp"

#include <filesystem>
#include <opencv2/core.hpp>

namespace flypath::io {

namespace fs = std::filesystem;

// 8-bit BGR image. Throws InvalidImageError if the file is missing, cannot be
// decoded or has zero area.
cv::Mat load_image(const fs::path& path);

// Throws InvalidImageError for an empty image.
ImageInfo image_info(const cv::Mat& image);

} // namespace flypath::io
