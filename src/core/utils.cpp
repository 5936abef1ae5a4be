#include "flypath/core/utils.hpp"
#include "flypath/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iterator>
#include <iomanip>
#include <random>
#include <sstream>

namespace flypath::core {

namespace {

std::tm to_tm(std::time_t t, bool utc) {
    std::tm out{};
    if (utc) {
        gmtime_r(&t, &out);
    } else {
        localtime_r(&t, &out);
    }
    return out;
}

} // namespace

// 2026-10-19T08:15:02.123Z
std::string get_iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    const std::tm tm = to_tm(std::chrono::system_clock::to_time_t(now), true);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

// <local date>_<local time>_<8 hex digits>, sorts by start time
std::string get_run_id() {
    const std::tm tm = to_tm(std::chrono::system_clock::to_time_t(
                                 std::chrono::system_clock::now()), false);

    std::random_device rd;
    std::uniform_int_distribution<std::uint32_t> dist;
    const std::uint32_t suffix = dist(rd);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_'
        << std::hex << std::setfill('0') << std::setw(8) << suffix;
    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("cannot create " + path.string());
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        throw IOError("short write to " + path.string());
    }
}

std::string to_lower(const std::string& s) {
    std::string out(s.size(), '\0');
    std::transform(s.begin(), s.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// frame_00042.jpg
std::string format_frame_name(const std::string& prefix, size_t frame_idx, const std::string& ext) {
    std::ostringstream oss;
    oss << prefix << std::setfill('0') << std::setw(5) << frame_idx << ext;
    return oss.str();
}

} // namespace flypath::core
