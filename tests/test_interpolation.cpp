#include "flypath/core/errors.hpp"
#include "flypath/planning/interpolation.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

using flypath::CameraState;
using flypath::Waypoint;
using flypath::planning::camera_state_at;
using flypath::planning::interpolate_path;
using flypath::planning::interpolate_segment;
using flypath::planning::path_frame_count;

TEST_CASE("segment_endpoints_are_exact") {
  const Waypoint a{500, 400, 1.0};
  const Waypoint b{150, 120, 1.4};

  CameraState first = interpolate_segment(a, b, 0, 60);
  CameraState last = interpolate_segment(a, b, 59, 60);
  REQUIRE(first == CameraState{500, 400, 1.0});
  REQUIRE(last == CameraState{150, 120, 1.4});
}

TEST_CASE("segment_zoom_midway_sample") {
  const Waypoint a{0, 0, 1.0};
  const Waypoint b{0, 0, 1.4};
  CameraState s = interpolate_segment(a, b, 30, 60);
  REQUIRE(s.zoom == Catch::Approx(1.0 + 0.4 * 30.0 / 59.0).epsilon(1e-12));
  REQUIRE(s.zoom == Catch::Approx(1.2034).margin(1e-4));
}

TEST_CASE("segment_position_rounds_to_nearest_pixel") {
  const Waypoint a{0, 0, 1.0};
  const Waypoint b{10, -10, 1.0};
  // t = 1/4 -> 2.5 rounds away from zero
  CameraState s = interpolate_segment(a, b, 1, 5);
  REQUIRE(s.x == 3);
  REQUIRE(s.y == -3);
}

TEST_CASE("segment_single_frame_holds_start") {
  const Waypoint a{10, 20, 1.0};
  const Waypoint b{90, 80, 1.4};
  CameraState s = interpolate_segment(a, b, 0, 1);
  REQUIRE(s == CameraState{10, 20, 1.0});
  REQUIRE_THROWS_AS(interpolate_segment(a, b, 1, 1), flypath::ValidationError);
}

TEST_CASE("path_frame_count_is_segments_times_frames") {
  REQUIRE(path_frame_count(7, 60) == 360);
  REQUIRE(path_frame_count(2, 1) == 1);
  REQUIRE(path_frame_count(1, 60) == 0);
  REQUIRE_THROWS_AS(path_frame_count(3, 0), flypath::ValidationError);
}

TEST_CASE("path_visits_every_waypoint_at_segment_start") {
  const std::vector<Waypoint> wps = {
      {500, 400, 1.0}, {50, 40, 1.4}, {950, 760, 1.4}, {500, 400, 1.0}};
  auto states = interpolate_path(wps, 10);
  REQUIRE(states.size() == 30);
  REQUIRE(states[0] == CameraState{500, 400, 1.0});
  REQUIRE(states[9] == CameraState{50, 40, 1.4});
  REQUIRE(states[10] == CameraState{50, 40, 1.4});
  REQUIRE(states[19] == CameraState{950, 760, 1.4});
  REQUIRE(states[20] == CameraState{950, 760, 1.4});
  REQUIRE(states[29] == CameraState{500, 400, 1.0});
}

TEST_CASE("camera_state_at_matches_full_path") {
  const std::vector<Waypoint> wps = {
      {320, 240, 1.0}, {100, 60, 1.4}, {600, 420, 1.4}, {320, 240, 1.0}};
  auto states = interpolate_path(wps, 7);
  for (size_t i = 0; i < states.size(); ++i)
    REQUIRE(camera_state_at(wps, 7, i) == states[i]);
  REQUIRE_THROWS_AS(camera_state_at(wps, 7, states.size()),
                    flypath::ValidationError);
}

TEST_CASE("path_is_deterministic") {
  const std::vector<Waypoint> wps = {{1, 2, 1.0}, {333, 777, 1.4}, {1, 2, 1.0}};
  REQUIRE(interpolate_path(wps, 13) == interpolate_path(wps, 13));
}

TEST_CASE("path_needs_two_waypoints") {
  REQUIRE_THROWS_AS(interpolate_path({{1, 2, 1.0}}, 10),
                    flypath::ValidationError);
}
