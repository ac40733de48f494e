#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace slide_ingest::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string format_iso_utc(SystemClock::time_point tp);
std::string format_utc(SystemClock::time_point tp, const char* fmt);
std::string get_run_id();
std::int64_t hours_since_epoch(SystemClock::time_point tp);

// Serialized single-line diagnostics on stderr: "[TAG] message"
void log_line(const std::string& tag, const std::string& message);

// File utilities
bool is_supported_image(const fs::path& path);
bool is_tiff(const fs::path& path);
std::vector<fs::path> discover_images(const fs::path& dir, bool recursive = true);
std::vector<fs::path> discover_tiffs(const fs::path& dir);
void move_file(const fs::path& src, const fs::path& dst);
void ensure_directory(const fs::path& dir);

// Math utilities
float compute_percentile(const VectorXf& data, float percentile);
double mean_of(const std::vector<double>& values);

// String utilities
std::string to_lower(const std::string& s);

} // namespace slide_ingest::core
