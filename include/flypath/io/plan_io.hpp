#pragma once

#include "flypath/pipeline/flight_plan.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace flypath::io {

namespace fs = std::filesystem;

// Image, parameters, scored cells, waypoints and per-frame camera state and
// viewport.
nlohmann::json flight_plan_to_json(const pipeline::FlightPlan& plan);

void write_flight_plan(const fs::path& path, const pipeline::FlightPlan& plan);

} // namespace flypath::io
