#pragma once

#include "flypath/config/configuration.hpp"
#include "flypath/pipeline/ports.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace flypath::render {

// cv::resize flag for a render.interpolation name
int interpolation_flag(const std::string& name);

// Crop-then-resize renderer over one decoded source image.
class OpenCvFrameRenderer : public pipeline::IFrameRenderer {
public:
    OpenCvFrameRenderer(cv::Mat source, const config::RenderConfig& cfg);

    cv::Mat render(const Viewport& viewport, int out_w, int out_h) const override;

private:
    cv::Mat source_;
    int interpolation_;
    bool debug_crosshair_;
};

} // namespace flypath::render
