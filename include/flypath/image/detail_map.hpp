#pragma once

#include "flypath/config/configuration.hpp"
#include "flypath/core/types.hpp"
#include "flypath/pipeline/ports.hpp"

#include <opencv2/core.hpp>

namespace flypath::image {

// Canny edge map of a BGR or grayscale 8-bit image, 1.0 on edges, 0.0
// elsewhere. Thresholds are fractions of the 8-bit range.
Matrix2Df compute_edge_map(const cv::Mat& image, const config::DetailConfig& cfg);

// Scores a cell as the mean of the detail map inside it.
class EdgeMapCellScorer : public pipeline::ICellScorer {
public:
    explicit EdgeMapCellScorer(Matrix2Df detail_map);

    float cell_score(const PixelRect& rect) override;

    const Matrix2Df& detail_map() const { return detail_map_; }

private:
    Matrix2Df detail_map_;
};

} // namespace flypath::image
