#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace flypath::config {

namespace fs = std::filesystem;

struct GridConfig {
  int size = 10; // GRID x GRID cells
};

struct PathConfig {
  int top_k = 5;               // detail cells to visit
  int frames_per_segment = 60; // samples between two waypoints
  double zoom_medium = 1.4;    // zoom at interior waypoints
};

struct DetailConfig {
  float blur_sigma = 1.0f;          // Gaussian pre-blur, 0 disables
  float canny_low_fraction = 0.10f; // hysteresis thresholds as a fraction
  float canny_high_fraction = 0.30f; // of the 8-bit range
};

struct RenderConfig {
  std::string interpolation = "lanczos"; // lanczos | cubic | linear | area | nearest
  bool debug_crosshair = false;
};

struct OutputConfig {
  std::string video_file = "drone_output.mp4";
  std::string codec = "mp4v"; // FourCC
  int fps = 30;
  bool write_frames = false;
  std::string frames_dir = "frames";
  bool write_plan = true;
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
  int progress_every = 50;
};

struct Config {
  GridConfig grid;
  PathConfig path;
  DetailConfig detail;
  RenderConfig render;
  OutputConfig output;
  RuntimeLimitsConfig runtime_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Non-fatal findings on a valid config, e.g. top_k above the cell count
  std::vector<std::string> warnings() const;
};

std::string get_schema_json();

} // namespace flypath::config
