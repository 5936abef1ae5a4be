#pragma once

#include "flypath/pipeline/ports.hpp"

#include <filesystem>
#include <opencv2/videoio.hpp>
#include <string>

namespace flypath::io {

namespace fs = std::filesystem;

// Encodes frames into a video container through cv::VideoWriter.
class OpenCvVideoWriter : public pipeline::IFrameSink {
public:
    OpenCvVideoWriter(fs::path output_path, std::string codec);
    ~OpenCvVideoWriter() override;

    OpenCvVideoWriter(const OpenCvVideoWriter&) = delete;
    OpenCvVideoWriter& operator=(const OpenCvVideoWriter&) = delete;

    void open(int fps, int width, int height) override;
    void write_frame(const cv::Mat& frame) override;
    void close() override;

    size_t frames_written() const { return frames_written_; }

private:
    fs::path output_path_;
    std::string codec_;
    cv::VideoWriter writer_;
    cv::Size size_;
    size_t frames_written_ = 0;
};

// Writes every frame as <dir>/frame_NNNNN.jpg.
class JpegSequenceWriter : public pipeline::IFrameSink {
public:
    explicit JpegSequenceWriter(fs::path dir, int quality = 95);

    void open(int fps, int width, int height) override;
    void write_frame(const cv::Mat& frame) override;
    void close() override {}

    size_t frames_written() const { return next_index_; }

private:
    fs::path dir_;
    int quality_;
    size_t next_index_ = 0;
};

} // namespace flypath::io
