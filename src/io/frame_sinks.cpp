#include "flypath/io/frame_sinks.hpp"

#include "flypath/core/errors.hpp"
#include "flypath/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>

#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace flypath::io {

OpenCvVideoWriter::OpenCvVideoWriter(fs::path output_path, std::string codec)
    : output_path_(std::move(output_path)), codec_(std::move(codec)) {
    if (codec_.size() != 4) {
        throw EncodingError("codec must be a four character code, got '" + codec_ + "'");
    }
}

OpenCvVideoWriter::~OpenCvVideoWriter() {
    if (writer_.isOpened()) {
        writer_.release();
    }
}

void OpenCvVideoWriter::open(int fps, int width, int height) {
    if (fps <= 0) {
        throw EncodingError("fps must be > 0");
    }
    if (width < 1 || height < 1) {
        throw EncodingError("frame size must be positive");
    }
    if (output_path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(output_path_.parent_path(), ec);
        if (ec) {
            throw EncodingError("cannot create " + output_path_.parent_path().string() +
                                ": " + ec.message());
        }
    }

    const int fourcc = cv::VideoWriter::fourcc(codec_[0], codec_[1], codec_[2], codec_[3]);
    size_ = cv::Size(width, height);
    bool opened = false;
    try {
        opened = writer_.open(output_path_.string(), fourcc, static_cast<double>(fps), size_, true);
    } catch (const cv::Exception& e) {
        throw EncodingError("cannot open video writer for " + output_path_.string() + ": " +
                            e.what());
    }
    if (!opened) {
        throw EncodingError("cannot open video writer for " + output_path_.string() +
                            " (codec " + codec_ + ")");
    }
    frames_written_ = 0;
}

void OpenCvVideoWriter::write_frame(const cv::Mat& frame) {
    if (!writer_.isOpened()) {
        throw EncodingError("video writer is not open");
    }
    if (frame.size() != size_ || frame.type() != CV_8UC3) {
        throw EncodingError("frame " + std::to_string(frames_written_) +
                            " does not match the stream format");
    }
    try {
        writer_.write(frame);
    } catch (const cv::Exception& e) {
        throw EncodingError("cannot encode frame " + std::to_string(frames_written_) +
                            " into " + output_path_.string() + ": " + e.what());
    }
    ++frames_written_;
}

void OpenCvVideoWriter::close() {
    if (writer_.isOpened()) {
        writer_.release();
    }
}

JpegSequenceWriter::JpegSequenceWriter(fs::path dir, int quality)
    : dir_(std::move(dir)), quality_(quality) {}

void JpegSequenceWriter::open(int /*fps*/, int /*width*/, int /*height*/) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw EncodingError("cannot create " + dir_.string() + ": " + ec.message());
    }
    next_index_ = 0;
}

void JpegSequenceWriter::write_frame(const cv::Mat& frame) {
    const fs::path p = dir_ / core::format_frame_name("frame_", next_index_, ".jpg");
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality_};
    bool ok = false;
    try {
        ok = cv::imwrite(p.string(), frame, params);
    } catch (const cv::Exception& e) {
        throw EncodingError("cannot write " + p.string() + ": " + e.what());
    }
    if (!ok) {
        throw EncodingError("cannot write " + p.string());
    }
    ++next_index_;
}

} // namespace flypath::io
