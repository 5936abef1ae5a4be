#include "runner_shared.hpp"

#include <iomanip>
#include <sstream>
#include <system_error>

namespace flypath::runner {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

std::string format_waypoint_line(size_t index, const Waypoint &wp) {
  std::ostringstream oss;
  oss << "  WP" << index << " -> x=" << wp.x << " y=" << wp.y << " zoom="
      << std::fixed << std::setprecision(2) << wp.zoom;
  return oss.str();
}

std::string format_duration(double seconds) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(seconds < 10.0 ? 2 : 1) << seconds
      << " s";
  return oss.str();
}

nlohmann::json summarize_run_events(std::istream &in) {
  using json = nlohmann::json;

  std::string line;
  std::string last_phase;
  std::string last_status;
  double progress = 0.0;
  size_t events = 0;
  size_t malformed = 0;

  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    try {
      const json ev = json::parse(line);
      const std::string type = ev.at("type").get<std::string>();
      if (type == "phase_start") {
        last_phase = ev.at("phase_name").get<std::string>();
        last_status = "running";
        progress = 0.0;
      } else if (type == "phase_progress") {
        progress = ev.at("progress").get<double>();
      } else if (type == "phase_end") {
        last_status = ev.at("status").get<std::string>();
        progress = 1.0;
      } else if (type == "run_end") {
        last_status = ev.value("success", false) ? "completed" : "failed";
      }
      ++events;
    } catch (const json::exception &) {
      ++malformed;
    }
  }

  json result;
  result["status"] = last_status.empty() ? "unknown" : last_status;
  result["current_phase"] =
      last_phase.empty() ? json(nullptr) : json(last_phase);
  result["progress"] = progress;
  result["events"] = events;
  result["malformed_lines"] = malformed;
  return result;
}

std::uintmax_t
remove_partial_outputs(const std::vector<std::filesystem::path> &paths) {
  std::uintmax_t removed = 0;
  for (const auto &p : paths) {
    if (p.empty())
      continue;
    std::error_code ec;
    const std::uintmax_t n = std::filesystem::remove_all(p, ec);
    if (!ec && n != static_cast<std::uintmax_t>(-1))
      removed += n;
  }
  return removed;
}

} // namespace flypath::runner
