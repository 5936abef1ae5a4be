#pragma once

#include "flypath/core/types.hpp"

#include <opencv2/core.hpp>

namespace flypath::pipeline {

// ─────────────────────────────────────────────
// Cell scoring
// ─────────────────────────────────────────────

// Returns the mean detail intensity of one region of the bound source image.
// Expected range is [0,1]. Throwing or returning a non-finite value fails the
// whole scoring pass.
class ICellScorer {
public:
    virtual ~ICellScorer() = default;

    virtual float cell_score(const PixelRect& rect) = 0;
};

// ─────────────────────────────────────────────
// Frame rendering
// ─────────────────────────────────────────────

// Crops the viewport from the bound source image and resizes it to
// out_w x out_h. Called once per output frame, possibly from several
// threads at once, so implementations must not mutate shared state.
class IFrameRenderer {
public:
    virtual ~IFrameRenderer() = default;

    virtual cv::Mat render(const Viewport& viewport, int out_w, int out_h) const = 0;
};

// ─────────────────────────────────────────────
// Frame sinks (encoder, image sequence)
// ─────────────────────────────────────────────

// Consumes rendered frames strictly in frame-index order.
// All methods throw EncodingError on failure.
class IFrameSink {
public:
    virtual ~IFrameSink() = default;

    virtual void open(int fps, int width, int height) = 0;

    virtual void write_frame(const cv::Mat& frame) = 0;

    // Flush and release. Safe to call more than once.
    virtual void close() = 0;
};

} // namespace flypath::pipeline
