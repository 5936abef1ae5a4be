#include "flypath/pipeline/frame_emitter.hpp"

#include "flypath/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace flypath::pipeline {

int resolve_worker_count(int requested, size_t task_count) {
    int workers = requested;
    if (workers < 1) {
        workers = 1;
    }
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers =
            std::min(workers, static_cast<int>(std::max<size_t>(1, task_count)));
    }
    return std::max(1, workers);
}

size_t emit_frames(const std::vector<Viewport>& viewports,
                   const ImageInfo& image,
                   const IFrameRenderer& renderer,
                   const std::vector<IFrameSink*>& sinks,
                   const EmitOptions& options) {
    if (image.width < 1 || image.height < 1) {
        throw InvalidImageError("image has zero area");
    }

    const size_t total = viewports.size();
    const int workers = resolve_worker_count(options.workers, total);
    const size_t batch = options.batch_size > 0
                             ? static_cast<size_t>(options.batch_size)
                             : static_cast<size_t>(workers) * 4;

    for (IFrameSink* sink : sinks) {
        sink->open(options.fps, image.width, image.height);
    }

    std::vector<cv::Mat> slots;
    size_t written = 0;

    for (size_t begin = 0; begin < total; begin += batch) {
        const size_t end = std::min(total, begin + batch);
        slots.assign(end - begin, cv::Mat());

        std::atomic<size_t> next{begin};
        std::atomic<bool> failed{false};
        std::mutex error_mutex;
        std::string error;

        auto render_worker = [&]() {
            while (!failed.load(std::memory_order_relaxed)) {
                const size_t fi = next.fetch_add(1);
                if (fi >= end) {
                    break;
                }
                std::string problem;
                try {
                    cv::Mat frame = renderer.render(viewports[fi], image.width, image.height);
                    if (frame.empty()) {
                        problem = "renderer returned an empty frame";
                    } else if (frame.cols != image.width || frame.rows != image.height) {
                        problem = "renderer returned " + std::to_string(frame.cols) + "x" +
                                  std::to_string(frame.rows) + ", expected " +
                                  std::to_string(image.width) + "x" +
                                  std::to_string(image.height);
                    } else {
                        slots[fi - begin] = std::move(frame);
                    }
                } catch (const std::exception& e) {
                    problem = e.what();
                }
                if (!problem.empty()) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!failed.exchange(true)) {
                        error = "frame " + std::to_string(fi) + ": " + problem;
                    }
                }
            }
        };

        if (workers > 1 && end - begin > 1) {
            std::vector<std::thread> pool;
            pool.reserve(static_cast<size_t>(workers));
            for (int w = 0; w < workers; ++w) {
                pool.emplace_back(render_worker);
            }
            for (auto& t : pool) {
                if (t.joinable()) {
                    t.join();
                }
            }
        } else {
            render_worker();
        }

        if (failed.load()) {
            throw RenderError(error);
        }

        for (size_t i = 0; i < slots.size(); ++i) {
            for (IFrameSink* sink : sinks) {
                sink->write_frame(slots[i]);
            }
            slots[i].release();
            ++written;
            if (options.progress_cb) {
                options.progress_cb(written, total);
            }
        }
    }

    for (IFrameSink* sink : sinks) {
        sink->close();
    }
    return written;
}

} // namespace flypath::pipeline
