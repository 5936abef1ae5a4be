#include "flypath/image/detail_map.hpp"

#include "flypath/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <string>
#include <utility>

namespace flypath::image {

Matrix2Df compute_edge_map(const cv::Mat& image, const config::DetailConfig& cfg) {
    if (image.empty()) {
        throw InvalidImageError("cannot build an edge map of an empty image");
    }
    if (image.depth() != CV_8U) {
        throw InvalidImageError("edge map expects an 8-bit image");
    }

    cv::Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        throw InvalidImageError("unsupported channel count " + std::to_string(image.channels()));
    }

    cv::Mat blurred = gray;
    if (cfg.blur_sigma > 0.0f) {
        cv::GaussianBlur(gray, blurred, cv::Size(0, 0), cfg.blur_sigma, cfg.blur_sigma,
                         cv::BORDER_REFLECT_101);
    }

    const double low = static_cast<double>(cfg.canny_low_fraction) * 255.0;
    const double high = static_cast<double>(cfg.canny_high_fraction) * 255.0;
    cv::Mat edges;
    cv::Canny(blurred, edges, low, high, 3, true);

    Matrix2Df out(edges.rows, edges.cols);
    cv::Mat out_cv(edges.rows, edges.cols, CV_32F, out.data());
    edges.convertTo(out_cv, CV_32F, 1.0 / 255.0);
    return out;
}

EdgeMapCellScorer::EdgeMapCellScorer(Matrix2Df detail_map)
    : detail_map_(std::move(detail_map)) {}

float EdgeMapCellScorer::cell_score(const PixelRect& rect) {
    const int rows = static_cast<int>(detail_map_.rows());
    const int cols = static_cast<int>(detail_map_.cols());
    if (rect.width < 1 || rect.height < 1 || rect.x < 0 || rect.y < 0 ||
        rect.x + rect.width > cols || rect.y + rect.height > rows) {
        throw ScoringError("cell " + std::to_string(rect.width) + "x" +
                           std::to_string(rect.height) + "+" + std::to_string(rect.x) +
                           "+" + std::to_string(rect.y) + " outside detail map " +
                           std::to_string(cols) + "x" + std::to_string(rows));
    }
    return detail_map_.block(rect.y, rect.x, rect.height, rect.width).mean();
}

} // namespace flypath::image
