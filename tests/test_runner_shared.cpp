#include "runner_shared.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>
#include <string>

using flypath::Waypoint;
using flypath::runner::TeeBuf;
using flypath::runner::format_duration;
using flypath::runner::format_waypoint_line;
using flypath::runner::remove_partial_outputs;
using flypath::runner::summarize_run_events;

namespace fs = std::filesystem;

TEST_CASE("waypoint_line_format") {
  REQUIRE(format_waypoint_line(0, Waypoint{500, 400, 1.0}) ==
          "  WP0 -> x=500 y=400 zoom=1.00");
  REQUIRE(format_waypoint_line(3, Waypoint{950, 40, 1.4}) ==
          "  WP3 -> x=950 y=40 zoom=1.40");
}

TEST_CASE("duration_format") {
  REQUIRE(format_duration(1.234) == "1.23 s");
  REQUIRE(format_duration(42.0) == "42.0 s");
}

TEST_CASE("tee_buffer_writes_both_streams") {
  std::ostringstream a;
  std::ostringstream b;
  TeeBuf tee(a.rdbuf(), b.rdbuf());
  std::ostream out(&tee);
  out << "phase " << 2 << "\n";
  out.flush();
  REQUIRE(a.str() == "phase 2\n");
  REQUIRE(b.str() == "phase 2\n");
}

TEST_CASE("run_events_summary_tracks_last_phase") {
  std::istringstream in(
      "{\"type\":\"run_start\",\"run_id\":\"r\"}\n"
      "{\"type\":\"phase_start\",\"phase_name\":\"RENDER\"}\n"
      "{\"type\":\"phase_progress\",\"progress\":0.5}\n"
      "\n"
      "{\"type\":\"phase_end\",\"status\":\"ok\"}\n"
      "{\"type\":\"run_end\",\"success\":true}\n");
  const auto s = summarize_run_events(in);
  REQUIRE(s["status"] == "completed");
  REQUIRE(s["current_phase"] == "RENDER");
  REQUIRE(s["progress"].get<double>() == 1.0);
  REQUIRE(s["events"] == 5);
  REQUIRE(s["malformed_lines"] == 0);
}

TEST_CASE("run_events_summary_reports_failed_run") {
  std::istringstream in(
      "{\"type\":\"phase_start\",\"phase_name\":\"PLANNING\"}\n"
      "{\"type\":\"phase_end\",\"status\":\"error\"}\n"
      "{\"type\":\"run_end\",\"success\":false}\n");
  const auto s = summarize_run_events(in);
  REQUIRE(s["status"] == "failed");
  REQUIRE(s["current_phase"] == "PLANNING");
}

TEST_CASE("run_events_summary_counts_malformed_lines") {
  std::istringstream in(
      "{\"type\":\"phase_start\",\"phase_name\":\"RENDER\"}\n"
      "{\"type\":5}\n"
      "{\"type\":\"phase_progress\",\"progress\":\"x\"}\n"
      "{\"type\":\"phase_end\"}\n"
      "{\"type\":\"run_end\",\"success\":\"yes\"}\n"
      "not json\n"
      "[1]\n"
      "{\"type\":\"phase_progress\",\"progress\":0.25}\n");
  nlohmann::json s;
  REQUIRE_NOTHROW(s = summarize_run_events(in));
  REQUIRE(s["malformed_lines"] == 6);
  REQUIRE(s["events"] == 2);
  REQUIRE(s["status"] == "running");
  REQUIRE(s["current_phase"] == "RENDER");
  REQUIRE(s["progress"].get<double>() == 0.25);
}

TEST_CASE("run_events_summary_of_empty_log") {
  std::istringstream in("");
  const auto s = summarize_run_events(in);
  REQUIRE(s["status"] == "unknown");
  REQUIRE(s["current_phase"].is_null());
  REQUIRE(s["events"] == 0);
}

TEST_CASE("partial_outputs_removed_with_frames_dir") {
  const fs::path root = fs::temp_directory_path() / "flypath_partial_outputs";
  fs::remove_all(root);
  fs::create_directories(root / "frames");
  const fs::path video = root / "flyover.mp4";
  std::ofstream(video) << "partial";
  std::ofstream(root / "frames" / "frame_00000.jpg") << "x";
  std::ofstream(root / "frames" / "frame_00001.jpg") << "x";

  const auto removed = remove_partial_outputs(
      {video, root / "frames", root / "missing.mp4", fs::path()});
  REQUIRE(removed == 4);
  REQUIRE_FALSE(fs::exists(video));
  REQUIRE_FALSE(fs::exists(root / "frames"));
  REQUIRE(fs::exists(root));
  fs::remove_all(root);
}
