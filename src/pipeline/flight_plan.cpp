#include "flypath/pipeline/flight_plan.hpp"

#include "flypath/core/errors.hpp"
#include "flypath/planning/detail_grid.hpp"
#include "flypath/planning/interpolation.hpp"
#include "flypath/planning/viewport.hpp"
#include "flypath/planning/waypoints.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace flypath::pipeline {

PlanParameters plan_parameters_from_config(const config::Config& cfg) {
    PlanParameters p;
    p.grid = cfg.grid.size;
    p.top_k = cfg.path.top_k;
    p.frames_per_segment = cfg.path.frames_per_segment;
    p.zoom_medium = cfg.path.zoom_medium;
    return p;
}

void validate_plan_parameters(const PlanParameters& params) {
    if (params.grid < 1) {
        throw ValidationError("grid must be >= 1");
    }
    if (params.top_k < 0) {
        throw ValidationError("top_k must be >= 0");
    }
    if (params.frames_per_segment < 1) {
        throw ValidationError("frames_per_segment must be >= 1");
    }
    if (!std::isfinite(params.zoom_medium) || params.zoom_medium < 1.0) {
        throw ValidationError("zoom_medium must be finite and >= 1.0");
    }
}

FlightPlan plan_flight(const ImageInfo& image,
                       const PlanParameters& params,
                       ICellScorer& scorer) {
    if (image.width < 1 || image.height < 1) {
        throw InvalidImageError("image has zero area (" + std::to_string(image.width) +
                                "x" + std::to_string(image.height) + ")");
    }
    validate_plan_parameters(params);

    FlightPlan plan;
    plan.image = image;
    plan.params = params;

    // Grid geometry is checked before the first scorer call.
    plan.cells = planning::score_detail_grid(image, params.grid, scorer);

    plan.top_k_effective = static_cast<int>(
        std::min(static_cast<size_t>(params.top_k), plan.cells.size()));
    plan.waypoints = planning::build_waypoints(image, plan.cells, params.top_k,
                                               params.zoom_medium);

    const size_t total = planning::path_frame_count(plan.waypoints.size(),
                                                    params.frames_per_segment);
    plan.viewports.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        const CameraState s = planning::camera_state_at(plan.waypoints,
                                                        params.frames_per_segment, i);
        plan.viewports.push_back(planning::resolve_viewport(s, image));
    }

    return plan;
}

} // namespace flypath::pipeline
