#include "flypath/io/image_io.hpp"

#include "flypath/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>

#include <string>

namespace flypath::io {

cv::Mat load_image(const fs::path& path) {
    if (!fs::exists(path) || !fs::is_regular_file(path)) {
        throw InvalidImageError("input file not found: " + path.string());
    }

    cv::Mat img;
    try {
        img = cv::imread(path.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw InvalidImageError("cannot decode " + path.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw InvalidImageError("cannot decode " + path.string());
    }
    return img;
}

ImageInfo image_info(const cv::Mat& image) {
    if (image.empty() || image.cols < 1 || image.rows < 1) {
        throw InvalidImageError("image has zero area (" + std::to_string(image.cols) +
                                "x" + std::to_string(image.rows) + ")");
    }
    ImageInfo info;
    info.width = image.cols;
    info.height = image.rows;
    return info;
}

} // namespace flypath::io
