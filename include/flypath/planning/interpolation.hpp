#pragma once

#include "flypath/core/types.hpp"

#include <cstddef>
#include <vector>

namespace flypath::planning {

// (n_waypoints - 1) * frames_per_segment, 0 for fewer than two waypoints
size_t path_frame_count(size_t n_waypoints, int frames_per_segment);

// Sample f of a segment from a to b, t = f / (frames_per_segment - 1)
// (t = 0 when frames_per_segment == 1). Position is rounded to the nearest
// pixel, zoom is linear. f = 0 returns a, f = frames_per_segment - 1 returns b
// (for frames_per_segment > 1).
CameraState interpolate_segment(const Waypoint& a,
                                const Waypoint& b,
                                int f,
                                int frames_per_segment);

// Camera state of one global frame index
CameraState camera_state_at(const std::vector<Waypoint>& waypoints,
                            int frames_per_segment,
                            size_t frame_index);

std::vector<CameraState> interpolate_path(const std::vector<Waypoint>& waypoints,
                                          int frames_per_segment);

} // namespace flypath::planning
