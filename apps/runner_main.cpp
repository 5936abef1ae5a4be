#include "flypath/config/configuration.hpp"
#include "flypath/core/errors.hpp"
#include "flypath/core/events.hpp"
#include "flypath/core/types.hpp"
#include "flypath/core/utils.hpp"
#include "flypath/image/detail_map.hpp"
#include "flypath/io/frame_sinks.hpp"
#include "flypath/io/image_io.hpp"
#include "flypath/io/plan_io.hpp"
#include "flypath/pipeline/flight_plan.hpp"
#include "flypath/pipeline/frame_emitter.hpp"
#include "flypath/render/frame_renderer.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

namespace core = flypath::core;
namespace io = flypath::io;
namespace pipeline = flypath::pipeline;
using flypath::Phase;
using flypath::runner::TeeBuf;

struct RunOptions {
  std::string input_path;
  std::string output_path;
  std::string config_path;
  std::string runs_dir;
  std::string run_id;
  int grid = 0;
  int top_k = 0;
  int frames_per_segment = 0;
  int fps = 0;
  double zoom_medium = 0.0;
  int workers = 0;
  bool dry_run = false;

  bool has_grid = false;
  bool has_top_k = false;
  bool has_frames_per_segment = false;
  bool has_fps = false;
  bool has_zoom_medium = false;
  bool has_workers = false;
};

void apply_overrides(flypath::config::Config &cfg, const RunOptions &opt) {
  if (opt.has_grid)
    cfg.grid.size = opt.grid;
  if (opt.has_top_k)
    cfg.path.top_k = opt.top_k;
  if (opt.has_frames_per_segment)
    cfg.path.frames_per_segment = opt.frames_per_segment;
  if (opt.has_fps)
    cfg.output.fps = opt.fps;
  if (opt.has_zoom_medium)
    cfg.path.zoom_medium = opt.zoom_medium;
  if (opt.has_workers)
    cfg.runtime_limits.parallel_workers = opt.workers;
}

int run_command(const RunOptions &opt) {
  using namespace flypath;

  config::Config cfg;
  try {
    if (!opt.config_path.empty()) {
      cfg = config::Config::load(opt.config_path);
    }
    apply_overrides(cfg, opt);
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::string run_id = opt.run_id.empty() ? core::get_run_id() : opt.run_id;
  fs::path run_dir = fs::absolute(fs::path(opt.runs_dir) / run_id);
  {
    std::error_code ec;
    fs::create_directories(run_dir / "logs", ec);
    if (!ec)
      fs::create_directories(run_dir / "outputs", ec);
    if (!ec)
      fs::create_directories(run_dir / "artifacts", ec);
    if (ec) {
      std::cerr << "Error: cannot create run directory " << run_dir << ": "
                << ec.message() << std::endl;
      return 1;
    }
  }

  try {
    cfg.save(run_dir / "config.yaml");
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl",
                               std::ios::out | std::ios::trunc);
  if (!event_log_file.is_open()) {
    std::cerr << "Error: cannot open events log file: "
              << (run_dir / "logs" / "run_events.jsonl") << std::endl;
    return 1;
  }
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const fs::path video_path = opt.output_path.empty()
                                  ? run_dir / "outputs" / cfg.output.video_file
                                  : fs::absolute(opt.output_path);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"input", opt.input_path},
                     {"config_path", opt.config_path},
                     {"run_dir", run_dir.string()},
                     {"output", video_path.string()},
                     {"dry_run", opt.dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Input:  " << opt.input_path << std::endl;
  std::cout << "Output: " << video_path.string() << std::endl;

  Phase current = Phase::SCAN_INPUT;
  bool video_started = false;
  const fs::path frames_dir = run_dir / "outputs" / cfg.output.frames_dir;

  try {
    // Phase 0: SCAN_INPUT
    emitter.phase_start(run_id, Phase::SCAN_INPUT, log_file);
    cv::Mat source = io::load_image(opt.input_path);
    const ImageInfo info = io::image_info(source);
    std::cout << "Image size: " << info.width << "x" << info.height
              << std::endl;
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                      {{"width", info.width}, {"height", info.height}},
                      log_file);

    // Phase 1: DETAIL_MAP
    current = Phase::DETAIL_MAP;
    emitter.phase_start(run_id, Phase::DETAIL_MAP, log_file);
    image::EdgeMapCellScorer scorer(image::compute_edge_map(source, cfg.detail));
    std::cout << "Edge map generated." << std::endl;
    emitter.phase_end(run_id, Phase::DETAIL_MAP, "ok",
                      {{"edge_density", scorer.detail_map().mean()}}, log_file);

    // Phase 2: PLANNING
    current = Phase::PLANNING;
    emitter.phase_start(run_id, Phase::PLANNING, log_file);
    const pipeline::PlanParameters params =
        pipeline::plan_parameters_from_config(cfg);
    const pipeline::FlightPlan plan = pipeline::plan_flight(info, params, scorer);

    if (plan.top_k_effective < params.top_k) {
      emitter.warning(run_id,
                      "top_k " + std::to_string(params.top_k) +
                          " exceeds the " + std::to_string(plan.cells.size()) +
                          " grid cells, visiting all of them",
                      log_file);
    }

    std::cout << "Waypoints: " << plan.waypoints.size() << " (start + top"
              << plan.top_k_effective << " + return)" << std::endl;
    for (size_t i = 0; i < plan.waypoints.size(); ++i) {
      std::cout << runner::format_waypoint_line(i, plan.waypoints[i])
                << std::endl;
    }

    if (cfg.output.write_plan) {
      io::write_flight_plan(run_dir / "artifacts" / "flight_plan.json", plan);
    }
    emitter.phase_end(run_id, Phase::PLANNING, "ok",
                      {{"cells", plan.cells.size()},
                       {"waypoints", plan.waypoints.size()},
                       {"top_k_effective", plan.top_k_effective},
                       {"segments", plan.segment_count()},
                       {"frames", plan.frame_count()}},
                      log_file);

    // Phase 3: RENDER
    current = Phase::RENDER;
    emitter.phase_start(run_id, Phase::RENDER, log_file);
    if (opt.dry_run) {
      emitter.phase_end(run_id, Phase::RENDER, "skipped",
                        {{"reason", "dry_run"}}, log_file);
      std::cout << "Dry run - no rendering" << std::endl;
      emitter.run_end(run_id, true, "ok", log_file);
      return 0;
    }

    render::OpenCvFrameRenderer renderer(source, cfg.render);
    io::OpenCvVideoWriter video(video_path, cfg.output.codec);
    std::vector<pipeline::IFrameSink *> sinks{&video};
    std::unique_ptr<io::JpegSequenceWriter> jpegs;
    if (cfg.output.write_frames) {
      jpegs = std::make_unique<io::JpegSequenceWriter>(frames_dir);
      sinks.push_back(jpegs.get());
    }

    pipeline::EmitOptions emit_opts;
    emit_opts.fps = cfg.output.fps;
    emit_opts.workers = cfg.runtime_limits.parallel_workers;
    const size_t every = static_cast<size_t>(cfg.runtime_limits.progress_every);
    emit_opts.progress_cb = [&](size_t done, size_t total) {
      if (done % every == 0 || done == total) {
        std::cout << "  generated frames: " << done << std::endl;
        emitter.phase_progress(run_id, Phase::RENDER, done, total,
                               "frames " + std::to_string(done) + "/" +
                                   std::to_string(total),
                               log_file);
      }
    };

    std::cout << "Generating " << plan.frame_count() << " frames with "
              << pipeline::resolve_worker_count(emit_opts.workers,
                                                plan.frame_count())
              << " workers..." << std::endl;
    const auto t0 = std::chrono::steady_clock::now();
    video_started = true;
    const size_t written = pipeline::emit_frames(plan.viewports, info, renderer,
                                                 sinks, emit_opts);
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - t0)
            .count();

    std::cout << "Total frames generated: " << written << " in "
              << runner::format_duration(elapsed) << std::endl;
    emitter.phase_end(run_id, Phase::RENDER, "ok",
                      {{"frames_written", written},
                       {"fps", cfg.output.fps},
                       {"output", video_path.string()},
                       {"seconds", elapsed}},
                      log_file);
  } catch (const std::exception &e) {
    if (video_started) {
      std::vector<fs::path> partial{video_path};
      if (cfg.output.write_frames)
        partial.push_back(frames_dir);
      runner::remove_partial_outputs(partial);
    }
    emitter.error(run_id, e.what(), log_file);
    emitter.phase_end(run_id, current, "error", {{"error", e.what()}},
                      log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during " << phase_to_string(current) << ": "
              << e.what() << std::endl;
    return 1;
  }

  emitter.phase_start(run_id, Phase::DONE, log_file);
  emitter.phase_end(run_id, Phase::DONE, "ok", {}, log_file);
  emitter.run_end(run_id, true, "ok", log_file);
  std::cout << "Done. Output: " << video_path.string() << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"flypath runner: drone-style flyover video from one image"};
  app.require_subcommand(1);

  RunOptions opt;

  auto run_cmd = app.add_subcommand("run", "Plan and render a flyover video");
  run_cmd->add_option("--input,-i", opt.input_path, "Input image")
      ->required();
  run_cmd->add_option("--output,-o", opt.output_path,
                      "Output video (default: <run_dir>/outputs/<output.video_file>)");
  run_cmd->add_option("--config", opt.config_path, "Path to config.yaml");
  run_cmd->add_option("--runs-dir", opt.runs_dir, "Runs directory")
      ->required();
  run_cmd->add_option("--run-id", opt.run_id, "Run id (default: generated)");
  auto grid_opt = run_cmd->add_option("--grid", opt.grid, "Grid side length");
  auto top_k_opt =
      run_cmd->add_option("--top-k", opt.top_k, "Detail cells to visit");
  auto fps_seg_opt = run_cmd->add_option("--frames-per-segment",
                                         opt.frames_per_segment,
                                         "Frames between two waypoints");
  auto fps_opt = run_cmd->add_option("--fps", opt.fps, "Output frame rate");
  auto zoom_opt = run_cmd->add_option("--zoom-medium", opt.zoom_medium,
                                      "Zoom factor at detail waypoints");
  auto workers_opt =
      run_cmd->add_option("--workers", opt.workers, "Render threads");
  run_cmd->add_flag("--dry-run", opt.dry_run,
                    "Plan and write artifacts without rendering");

  CLI11_PARSE(app, argc, argv);

  opt.has_grid = grid_opt->count() > 0;
  opt.has_top_k = top_k_opt->count() > 0;
  opt.has_frames_per_segment = fps_seg_opt->count() > 0;
  opt.has_fps = fps_opt->count() > 0;
  opt.has_zoom_medium = zoom_opt->count() > 0;
  opt.has_workers = workers_opt->count() > 0;

  if (run_cmd->parsed()) {
    return run_command(opt);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
