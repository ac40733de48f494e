#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace slide_ingest::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::vector<std::string> input_dirs{"./input"};
  std::string archive_dir = "./analysed";
  std::string output_dir = "./output";
  std::string logs_dir = "./logs";
  std::string catalog_file = "./catalog.jsonl";
};

struct EnhancementConfig {
  float histogram_clip = 0.5f; // percent per tail
  float clahe_clip = 1.5f;
  bool adaptive_grid = true;
  bool face_detection = true;
  std::string face_cascade;    // haarcascade xml; empty = unavailable
  bool auto_quality = true;
};

struct OutputConfig {
  int jpeg_quality = 95;
  bool png_archive = false;
  bool tiff_archive = false;
  bool jxl = false;
};

struct DuplicatesConfig {
  float threshold = 0.95f;
  bool auto_skip = false;
};

struct WatcherConfig {
  float debounce_seconds = 2.0f;
  int poll_interval_ms = 1000;
  float output_debounce_seconds = 0.5f;
};

struct RuntimeConfig {
  int workers = 2;
  bool stall_alert = true;
};

struct Config {
  PathsConfig paths;
  EnhancementConfig enhancement;
  OutputConfig output;
  DuplicatesConfig duplicates;
  WatcherConfig watcher;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace slide_ingest::config
