#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>
#include <vector>

namespace flypath {

namespace fs = std::filesystem;

// Row-major float matrix, same layout as a single-channel cv::Mat
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Source image dimensions
struct ImageInfo {
    int width = 0;
    int height = 0;
};

// Integer pixel rectangle
struct PixelRect {
    int x = 0;       // Top-left x coordinate
    int y = 0;       // Top-left y coordinate
    int width = 0;
    int height = 0;
};

// A viewport is the part of the source image visible in one frame
using Viewport = PixelRect;

// Detail grid cell
struct Cell {
    int index = 0;   // Row-major index
    int row = 0;     // Grid row index
    int col = 0;     // Grid column index
    PixelRect rect;
    int cx = 0;      // Center x (rect.x + rect.width / 2)
    int cy = 0;      // Center y (rect.y + rect.height / 2)
    float score = 0.0f;
};

// Planned stop of the camera
struct Waypoint {
    int x = 0;
    int y = 0;
    double zoom = 1.0;
};

// Camera sample at one frame
struct CameraState {
    int x = 0;
    int y = 0;
    double zoom = 1.0;
};

inline bool operator==(const PixelRect& a, const PixelRect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

inline bool operator!=(const PixelRect& a, const PixelRect& b) {
    return !(a == b);
}

inline bool operator==(const Waypoint& a, const Waypoint& b) {
    return a.x == b.x && a.y == b.y && a.zoom == b.zoom;
}

inline bool operator==(const CameraState& a, const CameraState& b) {
    return a.x == b.x && a.y == b.y && a.zoom == b.zoom;
}

// Run phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    DETAIL_MAP = 1,
    PLANNING = 2,
    RENDER = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::DETAIL_MAP: return "DETAIL_MAP";
        case Phase::PLANNING: return "PLANNING";
        case Phase::RENDER: return "RENDER";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace flypath
