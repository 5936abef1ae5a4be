#include "flypath/render/frame_renderer.hpp"

#include "flypath/core/errors.hpp"
#include "flypath/core/utils.hpp"

#include <opencv2/imgproc.hpp>

#include <string>
#include <utility>

namespace flypath::render {

int interpolation_flag(const std::string& name) {
    const std::string n = core::to_lower(name);
    if (n == "lanczos") return cv::INTER_LANCZOS4;
    if (n == "cubic") return cv::INTER_CUBIC;
    if (n == "linear") return cv::INTER_LINEAR;
    if (n == "area") return cv::INTER_AREA;
    if (n == "nearest") return cv::INTER_NEAREST;
    throw ValidationError("unknown interpolation '" + name + "'");
}

OpenCvFrameRenderer::OpenCvFrameRenderer(cv::Mat source, const config::RenderConfig& cfg)
    : source_(std::move(source)),
      interpolation_(interpolation_flag(cfg.interpolation)),
      debug_crosshair_(cfg.debug_crosshair) {
    if (source_.empty()) {
        throw InvalidImageError("renderer source image is empty");
    }
}

cv::Mat OpenCvFrameRenderer::render(const Viewport& viewport, int out_w, int out_h) const {
    if (out_w < 1 || out_h < 1) {
        throw RenderError("output size " + std::to_string(out_w) + "x" +
                          std::to_string(out_h) + " has zero area");
    }
    const cv::Rect roi(viewport.x, viewport.y, viewport.width, viewport.height);
    const cv::Rect bounds(0, 0, source_.cols, source_.rows);
    if (roi.width < 1 || roi.height < 1 || (roi & bounds) != roi) {
        throw RenderError("viewport " + std::to_string(roi.width) + "x" +
                          std::to_string(roi.height) + "+" + std::to_string(roi.x) + "+" +
                          std::to_string(roi.y) + " outside source image");
    }

    cv::Mat frame;
    try {
        cv::resize(source_(roi), frame, cv::Size(out_w, out_h), 0.0, 0.0, interpolation_);
    } catch (const cv::Exception& e) {
        throw RenderError(std::string("resize failed: ") + e.what());
    }

    if (debug_crosshair_) {
        const cv::Point c(out_w / 2, out_h / 2);
        cv::line(frame, cv::Point(c.x - 10, c.y), cv::Point(c.x + 10, c.y),
                 cv::Scalar(0, 0, 255), 2);
    }
    return frame;
}

} // namespace flypath::render
