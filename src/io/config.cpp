#include "flypath/config/configuration.hpp"
#include "flypath/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace flypath::config {

static bool is_known_interpolation(const std::string& name) {
    return name == "lanczos" || name == "cubic" || name == "linear" ||
           name == "area" || name == "nearest";
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top-level YAML node must be a mapping");
    }

    try {
        if (node["grid"]) {
            auto g = node["grid"];
            if (g["size"]) cfg.grid.size = g["size"].as<int>();
        }

        if (node["path"]) {
            auto p = node["path"];
            if (p["top_k"]) cfg.path.top_k = p["top_k"].as<int>();
            if (p["frames_per_segment"]) cfg.path.frames_per_segment = p["frames_per_segment"].as<int>();
            if (p["zoom_medium"]) cfg.path.zoom_medium = p["zoom_medium"].as<double>();
        }

        if (node["detail"]) {
            auto d = node["detail"];
            if (d["blur_sigma"]) cfg.detail.blur_sigma = d["blur_sigma"].as<float>();
            if (d["canny_low_fraction"]) cfg.detail.canny_low_fraction = d["canny_low_fraction"].as<float>();
            if (d["canny_high_fraction"]) cfg.detail.canny_high_fraction = d["canny_high_fraction"].as<float>();
        }

        if (node["render"]) {
            auto r = node["render"];
            if (r["interpolation"]) cfg.render.interpolation = r["interpolation"].as<std::string>();
            if (r["debug_crosshair"]) cfg.render.debug_crosshair = r["debug_crosshair"].as<bool>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["video_file"]) cfg.output.video_file = o["video_file"].as<std::string>();
            if (o["codec"]) cfg.output.codec = o["codec"].as<std::string>();
            if (o["fps"]) cfg.output.fps = o["fps"].as<int>();
            if (o["write_frames"]) cfg.output.write_frames = o["write_frames"].as<bool>();
            if (o["frames_dir"]) cfg.output.frames_dir = o["frames_dir"].as<std::string>();
            if (o["write_plan"]) cfg.output.write_plan = o["write_plan"].as<bool>();
        }

        if (node["runtime_limits"]) {
            auto rl = node["runtime_limits"];
            if (rl["parallel_workers"]) cfg.runtime_limits.parallel_workers = rl["parallel_workers"].as<int>();
            if (rl["progress_every"]) cfg.runtime_limits.progress_every = rl["progress_every"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    out << emitter.c_str() << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["grid"]["size"] = grid.size;

    node["path"]["top_k"] = path.top_k;
    node["path"]["frames_per_segment"] = path.frames_per_segment;
    node["path"]["zoom_medium"] = path.zoom_medium;

    node["detail"]["blur_sigma"] = detail.blur_sigma;
    node["detail"]["canny_low_fraction"] = detail.canny_low_fraction;
    node["detail"]["canny_high_fraction"] = detail.canny_high_fraction;

    node["render"]["interpolation"] = render.interpolation;
    node["render"]["debug_crosshair"] = render.debug_crosshair;

    node["output"]["video_file"] = output.video_file;
    node["output"]["codec"] = output.codec;
    node["output"]["fps"] = output.fps;
    node["output"]["write_frames"] = output.write_frames;
    node["output"]["frames_dir"] = output.frames_dir;
    node["output"]["write_plan"] = output.write_plan;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;
    node["runtime_limits"]["progress_every"] = runtime_limits.progress_every;

    return node;
}

void Config::validate() const {
    if (grid.size < 1) {
        throw ValidationError("grid.size must be >= 1");
    }

    if (path.top_k < 0) {
        throw ValidationError("path.top_k must be >= 0");
    }
    if (path.frames_per_segment < 1) {
        throw ValidationError("path.frames_per_segment must be >= 1");
    }
    if (!std::isfinite(path.zoom_medium)) {
        throw ValidationError("path.zoom_medium must be a finite number");
    }
    if (path.zoom_medium < 1.0) {
        throw ValidationError("path.zoom_medium must be >= 1.0");
    }

    if (!std::isfinite(detail.blur_sigma) || detail.blur_sigma < 0.0f) {
        throw ValidationError("detail.blur_sigma must be finite and >= 0");
    }
    if (!std::isfinite(detail.canny_low_fraction) || !std::isfinite(detail.canny_high_fraction)) {
        throw ValidationError("detail.canny_low_fraction/high_fraction must be finite");
    }
    if (detail.canny_high_fraction <= 0.0f || detail.canny_high_fraction > 1.0f) {
        throw ValidationError("detail.canny_high_fraction must be in (0,1]");
    }
    if (detail.canny_low_fraction <= 0.0f || detail.canny_low_fraction > detail.canny_high_fraction) {
        throw ValidationError("detail.canny_low_fraction must be in (0, canny_high_fraction]");
    }

    if (!is_known_interpolation(render.interpolation)) {
        throw ValidationError("render.interpolation must be one of lanczos, cubic, linear, area, nearest");
    }

    if (output.video_file.empty()) {
        throw ValidationError("output.video_file must not be empty");
    }
    if (output.codec.size() != 4) {
        throw ValidationError("output.codec must be a four character code");
    }
    if (output.fps <= 0) {
        throw ValidationError("output.fps must be > 0");
    }
    if (output.write_frames && output.frames_dir.empty()) {
        throw ValidationError("output.frames_dir must not be empty when output.write_frames is set");
    }

    if (runtime_limits.parallel_workers < 1) {
        throw ValidationError("runtime_limits.parallel_workers must be >= 1");
    }
    if (runtime_limits.progress_every < 1) {
        throw ValidationError("runtime_limits.progress_every must be >= 1");
    }
}

std::vector<std::string> Config::warnings() const {
    std::vector<std::string> out;
    const long long cells = static_cast<long long>(grid.size) * static_cast<long long>(grid.size);
    if (static_cast<long long>(path.top_k) > cells) {
        out.push_back("path.top_k " + std::to_string(path.top_k) + " exceeds the " +
                      std::to_string(cells) + " grid cells and will be clamped");
    }
    return out;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "grid": {
      "type": "object",
      "properties": {
        "size": {"type": "integer", "minimum": 1}
      }
    },
    "path": {
      "type": "object",
      "properties": {
        "top_k": {"type": "integer", "minimum": 0},
        "frames_per_segment": {"type": "integer", "minimum": 1},
        "zoom_medium": {"type": "number", "minimum": 1.0}
      }
    },
    "detail": {
      "type": "object",
      "properties": {
        "blur_sigma": {"type": "number", "minimum": 0},
        "canny_low_fraction": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "canny_high_fraction": {"type": "number", "exclusiveMinimum": 0, "maximum": 1}
      }
    },
    "render": {
      "type": "object",
      "properties": {
        "interpolation": {"type": "string", "enum": ["lanczos", "cubic", "linear", "area", "nearest"]},
        "debug_crosshair": {"type": "boolean"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "video_file": {"type": "string", "minLength": 1},
        "codec": {"type": "string", "minLength": 4, "maxLength": 4},
        "fps": {"type": "integer", "minimum": 1},
        "write_frames": {"type": "boolean"},
        "frames_dir": {"type": "string"},
        "write_plan": {"type": "boolean"}
      }
    },
    "runtime_limits": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1},
        "progress_every": {"type": "integer", "minimum": 1}
      }
    }
  }
})";
}

} // namespace flypath::config
