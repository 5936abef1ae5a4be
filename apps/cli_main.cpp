#include "flypath/config/configuration.hpp"
#include "flypath/core/types.hpp"
#include "flypath/image/detail_map.hpp"
#include "flypath/io/image_io.hpp"
#include "flypath/io/plan_io.hpp"
#include "flypath/pipeline/flight_plan.hpp"

#include "runner_shared.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_file_text(const fs::path& p) {
    std::ifstream ifs(p);
    if (!ifs) return "";
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << flypath::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// load-config <path>
// ============================================================================
int cmd_load_config(const std::string& path) {
    fs::path p(path);
    if (!fs::exists(p)) {
        json result;
        result["ok"] = false;
        result["error"] = "File not found: " + path;
        print_json(result);
        return 1;
    }

    std::string yaml_text = read_file_text(p);
    json result;
    result["path"] = path;
    result["yaml"] = yaml_text;
    print_json(result);
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin, bool strict_exit) {
    std::string yaml_text;
    if (!path.empty()) {
        yaml_text = read_file_text(path);
    } else if (use_stdin) {
        yaml_text = read_stdin();
    } else {
        yaml_text = yaml_arg;
    }

    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        YAML::Node node = YAML::Load(yaml_text);
        flypath::config::Config cfg = flypath::config::Config::from_yaml(node);
        cfg.validate();
        result["valid"] = true;
        for (const std::string& w : cfg.warnings()) {
            result["warnings"].push_back(w);
        }
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// plan <image> [--config <path>]
//
// Scores the image and prints the full flight plan without rendering.
// ============================================================================
int cmd_plan(const std::string& image_path, const std::string& config_path) {
    namespace image = flypath::image;
    namespace io = flypath::io;
    namespace pipeline = flypath::pipeline;

    try {
        flypath::config::Config cfg;
        if (!config_path.empty()) {
            cfg = flypath::config::Config::load(config_path);
        }
        cfg.validate();

        cv::Mat source = io::load_image(image_path);
        const flypath::ImageInfo info = io::image_info(source);
        image::EdgeMapCellScorer scorer(image::compute_edge_map(source, cfg.detail));
        const pipeline::FlightPlan plan =
            pipeline::plan_flight(info, pipeline::plan_parameters_from_config(cfg), scorer);

        json result = io::flight_plan_to_json(plan);
        result["ok"] = true;
        result["input"] = image_path;
        print_json(result);
        return 0;
    } catch (const std::exception& e) {
        json result;
        result["ok"] = false;
        result["input"] = image_path;
        result["error"] = e.what();
        print_json(result);
        return 1;
    }
}

// ============================================================================
// get-run-status <run_dir>
// ============================================================================
int cmd_get_run_status(const std::string& run_dir) {
    fs::path p(run_dir);

    json result;
    result["run_dir"] = run_dir;
    result["exists"] = fs::exists(p);
    result["status"] = "unknown";
    result["current_phase"] = nullptr;
    result["progress"] = 0;

    fs::path events_file = p / "logs" / "run_events.jsonl";
    std::ifstream ifs(events_file);
    if (ifs) {
        const json summary = flypath::runner::summarize_run_events(ifs);
        for (auto& [key, value] : summary.items()) {
            result[key] = value;
        }
    }

    print_json(result);
    return 0;
}

static void print_usage() {
    std::cerr << "Usage: flypath_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  get-schema                      Print config JSON schema\n"
              << "  load-config <path>              Print a YAML config file as JSON\n"
              << "  validate-config --path P | --yaml Y | --stdin [--strict-exit-codes]\n"
              << "                                  Validate a config\n"
              << "  plan <image> [--config P]       Print the flight plan for an image\n"
              << "  get-run-status <run_dir>        Summarize the events of a run\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "load-config") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "load-config requires a path argument\n";
            return 1;
        }
        return cmd_load_config(path);
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "plan") {
        std::string image_path = get_positional(0);
        if (image_path.empty()) {
            std::cerr << "plan requires an image argument\n";
            return 1;
        }
        return cmd_plan(image_path, get_arg("--config", "-c"));
    }

    if (command == "get-run-status") {
        std::string run_dir = get_positional(0);
        if (run_dir.empty()) {
            std::cerr << "get-run-status requires a run_dir argument\n";
            return 1;
        }
        return cmd_get_run_status(run_dir);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
