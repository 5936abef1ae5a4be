#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>

namespace flypath::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);
std::string format_frame_name(const std::string& prefix, size_t frame_idx, const std::string& ext);

} // namespace flypath::core
