#pragma once

#include "flypath/config/configuration.hpp"
#include "flypath/core/types.hpp"
#include "flypath/pipeline/ports.hpp"

#include <vector>

namespace flypath::pipeline {

struct PlanParameters {
    int grid = 10;
    int top_k = 5;
    int frames_per_segment = 60;
    double zoom_medium = 1.4;
};

struct FlightPlan {
    ImageInfo image;
    PlanParameters params;
    std::vector<Cell> cells;          // row-major, scored
    std::vector<Waypoint> waypoints;  // center, top-k, center
    int top_k_effective = 0;          // top_k clamped to the cell count
    std::vector<Viewport> viewports;  // one per output frame

    size_t frame_count() const { return viewports.size(); }
    size_t segment_count() const { return waypoints.empty() ? 0 : waypoints.size() - 1; }
};

PlanParameters plan_parameters_from_config(const config::Config& cfg);

// Throws ValidationError on grid < 1, top_k < 0, frames_per_segment < 1 or
// zoom_medium that is non-finite or below 1.0.
void validate_plan_parameters(const PlanParameters& params);

// Validates the image and parameters before the first scorer call, then
// scores the grid, selects waypoints and resolves one viewport per frame.
FlightPlan plan_flight(const ImageInfo& image,
                       const PlanParameters& params,
                       ICellScorer& scorer);

} // namespace flypath::pipeline
