#include "slide_ingest/config/configuration.hpp"
#include "slide_ingest/core/errors.hpp"

#include <fstream>

namespace slide_ingest::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (!n) return;
    if (n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    } else if (n.IsScalar()) {
        out = {n.as<std::string>()};
    }
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

    try {
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value in " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["paths"]) {
        auto p = node["paths"];
        read_string_list(p["input_dirs"], cfg.paths.input_dirs);
        if (p["archive_dir"]) cfg.paths.archive_dir = p["archive_dir"].as<std::string>();
        if (p["output_dir"]) cfg.paths.output_dir = p["output_dir"].as<std::string>();
        if (p["logs_dir"]) cfg.paths.logs_dir = p["logs_dir"].as<std::string>();
        if (p["catalog_file"]) cfg.paths.catalog_file = p["catalog_file"].as<std::string>();
    }

    if (node["enhancement"]) {
        auto e = node["enhancement"];
        if (e["histogram_clip"]) cfg.enhancement.histogram_clip = e["histogram_clip"].as<float>();
        if (e["clahe_clip"]) cfg.enhancement.clahe_clip = e["clahe_clip"].as<float>();
        if (e["adaptive_grid"]) cfg.enhancement.adaptive_grid = e["adaptive_grid"].as<bool>();
        if (e["face_detection"]) cfg.enhancement.face_detection = e["face_detection"].as<bool>();
        if (e["face_cascade"]) cfg.enhancement.face_cascade = e["face_cascade"].as<std::string>();
        if (e["auto_quality"]) cfg.enhancement.auto_quality = e["auto_quality"].as<bool>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["jpeg_quality"]) cfg.output.jpeg_quality = o["jpeg_quality"].as<int>();
        if (o["png_archive"]) cfg.output.png_archive = o["png_archive"].as<bool>();
        if (o["tiff_archive"]) cfg.output.tiff_archive = o["tiff_archive"].as<bool>();
        if (o["jxl"]) cfg.output.jxl = o["jxl"].as<bool>();
    }

    if (node["duplicates"]) {
        auto d = node["duplicates"];
        if (d["threshold"]) cfg.duplicates.threshold = d["threshold"].as<float>();
        if (d["auto_skip"]) cfg.duplicates.auto_skip = d["auto_skip"].as<bool>();
    }

    if (node["watcher"]) {
        auto w = node["watcher"];
        if (w["debounce_seconds"]) cfg.watcher.debounce_seconds = w["debounce_seconds"].as<float>();
        if (w["poll_interval_ms"]) cfg.watcher.poll_interval_ms = w["poll_interval_ms"].as<int>();
        if (w["output_debounce_seconds"]) {
            cfg.watcher.output_debounce_seconds = w["output_debounce_seconds"].as<float>();
        }
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["workers"]) cfg.runtime.workers = r["workers"].as<int>();
        if (r["stall_alert"]) cfg.runtime.stall_alert = r["stall_alert"].as<bool>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    for (const auto& dir : paths.input_dirs) {
        node["paths"]["input_dirs"].push_back(dir);
    }
    node["paths"]["archive_dir"] = paths.archive_dir;
    node["paths"]["output_dir"] = paths.output_dir;
    node["paths"]["logs_dir"] = paths.logs_dir;
    node["paths"]["catalog_file"] = paths.catalog_file;

    node["enhancement"]["histogram_clip"] = enhancement.histogram_clip;
    node["enhancement"]["clahe_clip"] = enhancement.clahe_clip;
    node["enhancement"]["adaptive_grid"] = enhancement.adaptive_grid;
    node["enhancement"]["face_detection"] = enhancement.face_detection;
    node["enhancement"]["face_cascade"] = enhancement.face_cascade;
    node["enhancement"]["auto_quality"] = enhancement.auto_quality;

    node["output"]["jpeg_quality"] = output.jpeg_quality;
    node["output"]["png_archive"] = output.png_archive;
    node["output"]["tiff_archive"] = output.tiff_archive;
    node["output"]["jxl"] = output.jxl;

    node["duplicates"]["threshold"] = duplicates.threshold;
    node["duplicates"]["auto_skip"] = duplicates.auto_skip;

    node["watcher"]["debounce_seconds"] = watcher.debounce_seconds;
    node["watcher"]["poll_interval_ms"] = watcher.poll_interval_ms;
    node["watcher"]["output_debounce_seconds"] = watcher.output_debounce_seconds;

    node["runtime"]["workers"] = runtime.workers;
    node["runtime"]["stall_alert"] = runtime.stall_alert;

    return node;
}

void Config::validate() const {
    if (paths.input_dirs.empty()) {
        throw ValidationError("paths.input_dirs must name at least one directory");
    }
    for (const auto& dir : paths.input_dirs) {
        if (dir.empty()) {
            throw ValidationError("paths.input_dirs must not contain empty entries");
        }
    }
    if (paths.archive_dir.empty() || paths.output_dir.empty()) {
        throw ValidationError("paths.archive_dir and paths.output_dir must be set");
    }
    if (paths.archive_dir == paths.output_dir) {
        throw ValidationError("paths.archive_dir and paths.output_dir must differ");
    }

    if (enhancement.histogram_clip < 0.0f || enhancement.histogram_clip >= 50.0f) {
        throw ValidationError("enhancement.histogram_clip must be in [0,50)");
    }
    if (!(enhancement.clahe_clip > 0.0f)) {
        throw ValidationError("enhancement.clahe_clip must be > 0");
    }

    if (output.jpeg_quality < 1 || output.jpeg_quality > 100) {
        throw ValidationError("output.jpeg_quality must be in [1,100]");
    }

    if (!(duplicates.threshold > 0.0f) || duplicates.threshold > 1.0f) {
        throw ValidationError("duplicates.threshold must be in (0,1]");
    }

    if (watcher.debounce_seconds < 0.0f) {
        throw ValidationError("watcher.debounce_seconds must be >= 0");
    }
    if (watcher.poll_interval_ms < 10) {
        throw ValidationError("watcher.poll_interval_ms must be >= 10");
    }
    if (watcher.output_debounce_seconds < 0.0f) {
        throw ValidationError("watcher.output_debounce_seconds must be >= 0");
    }

    if (runtime.workers < 1 || runtime.workers > 64) {
        throw ValidationError("runtime.workers must be in [1,64]");
    }
}

} // namespace slide_ingest::config
