#pragma once

#include "flypath/core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <streambuf>
#include <string>
#include <vector>

namespace flypath::runner {

// Duplicates everything written to it into two stream buffers.
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

std::string format_waypoint_line(size_t index, const Waypoint &wp);

std::string format_duration(double seconds);

// Replays a run_events.jsonl stream: last phase name, its status ("running",
// phase_end status, "completed" or "failed") and progress fraction. Lines
// that are not events with well-typed fields are counted in
// "malformed_lines" and skipped.
nlohmann::json summarize_run_events(std::istream &in);

// Deletes files or directories left by a failed render. Missing paths are
// ignored; returns the number of entries removed.
std::uintmax_t remove_partial_outputs(const std::vector<std::filesystem::path> &paths);

} // namespace flypath::runner
