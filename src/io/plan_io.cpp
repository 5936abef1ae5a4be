#include "flypath/io/plan_io.hpp"

#include "flypath/core/utils.hpp"
#include "flypath/planning/interpolation.hpp"

namespace flypath::io {

using json = nlohmann::json;

namespace {

json rect_to_json(const PixelRect& r) {
    return {{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

} // namespace

json flight_plan_to_json(const pipeline::FlightPlan& plan) {
    json j;
    j["image"] = {{"width", plan.image.width}, {"height", plan.image.height}};
    j["params"] = {
        {"grid", plan.params.grid},
        {"top_k", plan.params.top_k},
        {"top_k_effective", plan.top_k_effective},
        {"frames_per_segment", plan.params.frames_per_segment},
        {"zoom_medium", plan.params.zoom_medium}
    };

    j["cells"] = json::array();
    for (const Cell& c : plan.cells) {
        j["cells"].push_back({
            {"index", c.index},
            {"row", c.row},
            {"col", c.col},
            {"rect", rect_to_json(c.rect)},
            {"center", {c.cx, c.cy}},
            {"score", c.score}
        });
    }

    j["waypoints"] = json::array();
    for (const Waypoint& wp : plan.waypoints) {
        j["waypoints"].push_back({{"x", wp.x}, {"y", wp.y}, {"zoom", wp.zoom}});
    }

    j["segment_count"] = plan.segment_count();
    j["frame_count"] = plan.frame_count();
    j["frames"] = json::array();
    for (size_t i = 0; i < plan.viewports.size(); ++i) {
        const CameraState s = planning::camera_state_at(plan.waypoints,
                                                        plan.params.frames_per_segment, i);
        j["frames"].push_back({
            {"index", i},
            {"camera", {{"x", s.x}, {"y", s.y}, {"zoom", s.zoom}}},
            {"viewport", rect_to_json(plan.viewports[i])}
        });
    }
    return j;
}

void write_flight_plan(const fs::path& path, const pipeline::FlightPlan& plan) {
    core::write_text(path, flight_plan_to_json(plan).dump(2) + "\n");
}

} // namespace flypath::io
