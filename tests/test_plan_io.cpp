#include "flypath/io/plan_io.hpp"
#include "flypath/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

using flypath::ImageInfo;
using flypath::PixelRect;
using flypath::pipeline::FlightPlan;
using flypath::pipeline::PlanParameters;

namespace {

class ConstantScorer : public flypath::pipeline::ICellScorer {
public:
  float cell_score(const PixelRect &) override { return 0.25f; }
};

FlightPlan small_plan() {
  PlanParameters p;
  p.grid = 2;
  p.top_k = 1;
  p.frames_per_segment = 3;
  p.zoom_medium = 2.0;
  ConstantScorer scorer;
  return flypath::pipeline::plan_flight(ImageInfo{200, 100}, p, scorer);
}

} // namespace

TEST_CASE("plan_json_lists_cells_waypoints_and_frames") {
  const FlightPlan plan = small_plan();
  nlohmann::json j = flypath::io::flight_plan_to_json(plan);

  REQUIRE(j["image"]["width"] == 200);
  REQUIRE(j["params"]["top_k_effective"] == 1);
  REQUIRE(j["cells"].size() == 4);
  REQUIRE(j["waypoints"].size() == 3);
  REQUIRE(j["segment_count"] == 2);
  REQUIRE(j["frame_count"] == 6);
  REQUIRE(j["frames"].size() == 6);

  // equal scores: cell 0 wins, its center is (50, 25)
  REQUIRE(j["waypoints"][1]["x"] == 50);
  REQUIRE(j["waypoints"][1]["y"] == 25);
  REQUIRE(j["frames"][2]["camera"]["zoom"] == 2.0);
  REQUIRE(j["frames"][2]["viewport"]["width"] == 100);
  REQUIRE(j["frames"][2]["viewport"]["x"] == 0);
}

TEST_CASE("plan_json_written_to_disk_parses_back") {
  namespace fs = std::filesystem;
  const fs::path p = fs::temp_directory_path() / "flypath_test_plan.json";

  flypath::io::write_flight_plan(p, small_plan());
  nlohmann::json j = nlohmann::json::parse(flypath::core::read_text(p));
  REQUIRE(j["frame_count"] == 6);

  fs::remove(p);
}
