#include "flypath/planning/interpolation.hpp"

#include "flypath/core/errors.hpp"

#include <cmath>
#include <string>

namespace flypath::planning {

namespace {

void check_frames_per_segment(int frames_per_segment) {
    if (frames_per_segment < 1) {
        throw ValidationError("frames_per_segment must be >= 1");
    }
}

void check_waypoints(const std::vector<Waypoint>& waypoints) {
    if (waypoints.size() < 2) {
        throw ValidationError("a path needs at least two waypoints, got " +
                              std::to_string(waypoints.size()));
    }
}

int lerp_position(int a, int b, double t) {
    const double v = static_cast<double>(a) + static_cast<double>(b - a) * t;
    return static_cast<int>(std::lround(v));
}

// Exact at both ends: t = 0 gives a, t = 1 gives b.
double lerp_zoom(double a, double b, double t) {
    return (1.0 - t) * a + t * b;
}

} // namespace

size_t path_frame_count(size_t n_waypoints, int frames_per_segment) {
    check_frames_per_segment(frames_per_segment);
    if (n_waypoints < 2) return 0;
    return (n_waypoints - 1) * static_cast<size_t>(frames_per_segment);
}

CameraState interpolate_segment(const Waypoint& a,
                                const Waypoint& b,
                                int f,
                                int frames_per_segment) {
    check_frames_per_segment(frames_per_segment);
    if (f < 0 || f >= frames_per_segment) {
        throw ValidationError("segment sample " + std::to_string(f) + " outside [0," +
                              std::to_string(frames_per_segment - 1) + "]");
    }

    const int n = frames_per_segment - 1;
    const double t = (n == 0) ? 0.0 : static_cast<double>(f) / static_cast<double>(n);

    CameraState s;
    s.x = lerp_position(a.x, b.x, t);
    s.y = lerp_position(a.y, b.y, t);
    s.zoom = lerp_zoom(a.zoom, b.zoom, t);
    return s;
}

CameraState camera_state_at(const std::vector<Waypoint>& waypoints,
                            int frames_per_segment,
                            size_t frame_index) {
    check_waypoints(waypoints);
    const size_t total = path_frame_count(waypoints.size(), frames_per_segment);
    if (frame_index >= total) {
        throw ValidationError("frame index " + std::to_string(frame_index) +
                              " outside path of " + std::to_string(total) + " frames");
    }

    const size_t fps = static_cast<size_t>(frames_per_segment);
    const size_t seg = frame_index / fps;
    const int f = static_cast<int>(frame_index % fps);
    return interpolate_segment(waypoints[seg], waypoints[seg + 1], f, frames_per_segment);
}

std::vector<CameraState> interpolate_path(const std::vector<Waypoint>& waypoints,
                                          int frames_per_segment) {
    check_waypoints(waypoints);
    std::vector<CameraState> states;
    states.reserve(path_frame_count(waypoints.size(), frames_per_segment));

    for (size_t seg = 0; seg + 1 < waypoints.size(); ++seg) {
        for (int f = 0; f < frames_per_segment; ++f) {
            states.push_back(interpolate_segment(waypoints[seg], waypoints[seg + 1], f,
                                                 frames_per_segment));
        }
    }
    return states;
}

} // namespace flypath::planning
