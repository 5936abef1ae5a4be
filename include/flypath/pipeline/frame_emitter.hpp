#pragma once

#include "flypath/core/types.hpp"
#include "flypath/pipeline/ports.hpp"

#include <functional>
#include <vector>

namespace flypath::pipeline {

struct EmitOptions {
    int fps = 30;
    int workers = 1;
    // Frames rendered ahead of the sinks, 0 = 4 * workers
    int batch_size = 0;
    // Called from the emitting thread after each frame reaches the sinks
    std::function<void(size_t done, size_t total)> progress_cb;
};

// Clamps a requested worker count to [1, min(hardware threads, task_count)].
int resolve_worker_count(int requested, size_t task_count);

// Renders every viewport at the source resolution and writes the frames to
// all sinks in frame-index order. Sinks are opened first and closed on
// success. Throws RenderError (renderer failure, empty or mis-sized frame)
// or EncodingError (sink failure); nothing is skipped or substituted.
// Returns the number of frames written.
size_t emit_frames(const std::vector<Viewport>& viewports,
                   const ImageInfo& image,
                   const IFrameRenderer& renderer,
                   const std::vector<IFrameSink*>& sinks,
                   const EmitOptions& options);

} // namespace flypath::pipeline
