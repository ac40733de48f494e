#include "slide_ingest/config/configuration.hpp"
#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/core/events.hpp"
#include "slide_ingest/core/json_io.hpp"
#include "slide_ingest/core/utils.hpp"
#include "slide_ingest/dedup/duplicate_detector.hpp"
#include "slide_ingest/image/enhancement.hpp"
#include "slide_ingest/pipeline/collaborators.hpp"
#include "slide_ingest/pipeline/orchestrator.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <streambuf>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using namespace slide_ingest;

std::atomic<bool> g_stop{false};

extern "C" void handle_signal(int) { g_stop = true; }

// Duplicates every write to two stream buffers (stdout + events file).
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == traits_type::eof())
      return traits_type::not_eof(c);
    const int ra = a_->sputc(static_cast<char>(c));
    const int rb = b_->sputc(static_cast<char>(c));
    return (ra == traits_type::eof() || rb == traits_type::eof()) ? traits_type::eof() : c;
  }

  int sync() override {
    const int ra = a_->pubsync();
    const int rb = b_->pubsync();
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

void print_json(const json &j) { std::cout << j.dump(2) << std::endl; }

config::Config load_config(const std::string &path) {
  config::Config cfg = path.empty() ? config::Config{} : config::Config::load(path);
  cfg.validate();
  return cfg;
}

int run_command(const std::string &config_path) {
  const config::Config cfg = load_config(config_path);

  core::ensure_directory(cfg.paths.logs_dir);
  const fs::path events_file = fs::path(cfg.paths.logs_dir) / "events.jsonl";
  std::ofstream events_out(events_file, std::ios::app);
  if (!events_out) {
    throw IOError("Cannot open event log: " + events_file.string());
  }
  TeeBuf tee(std::cout.rdbuf(), events_out.rdbuf());
  std::ostream event_stream(&tee);

  core::EventEmitter events(core::get_run_id(), event_stream);
  pipeline::JsonlCatalog catalog(cfg.paths.catalog_file);
  pipeline::EventStatusSink status(events);

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  pipeline::Orchestrator orchestrator(cfg, catalog, events, nullptr, &status);
  events.run_start({{"config_path", config_path},
                    {"input_dirs", cfg.paths.input_dirs},
                    {"archive_dir", cfg.paths.archive_dir},
                    {"output_dir", cfg.paths.output_dir},
                    {"workers", cfg.runtime.workers}});

  orchestrator.start();
  while (!g_stop) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  core::log_line("PIPELINE", "Shutdown requested");
  orchestrator.stop();

  const auto snap = orchestrator.telemetry();
  events.emit("telemetry", json(snap));
  events.run_end(true, "stopped");
  return 0;
}

int process_command(const std::string &config_path, const std::string &file,
                    bool archived) {
  const config::Config cfg = load_config(config_path);

  core::EventEmitter events(core::get_run_id(), std::cout);
  pipeline::JsonlCatalog catalog(cfg.paths.catalog_file);
  pipeline::Orchestrator orchestrator(cfg, catalog, events);

  const auto outcome = archived ? orchestrator.process_archived_file(file)
                                : orchestrator.process_file(file);
  events.run_end(outcome != pipeline::FileOutcome::FAILED,
                 pipeline::file_outcome_to_string(outcome));
  return outcome == pipeline::FileOutcome::FAILED ? 1 : 0;
}

int recover_command(const std::string &config_path) {
  const config::Config cfg = load_config(config_path);

  core::EventEmitter events(core::get_run_id(), std::cout);
  pipeline::JsonlCatalog catalog(cfg.paths.catalog_file);
  pipeline::Orchestrator orchestrator(cfg, catalog, events);

  const int attempted = orchestrator.recover_unprocessed();
  const auto &stats = orchestrator.stats();
  events.run_end(stats.errors() == 0, "recovered");
  print_json({{"attempted", attempted},
              {"processed", stats.processed()},
              {"errors", stats.errors()}});
  return stats.errors() == 0 ? 0 : 1;
}

int dedup_command(const std::string &dir, double threshold, int workers) {
  core::WorkerPool pool(workers);
  dedup::DuplicateDetector detector(threshold, &pool);
  const auto groups = detector.find_groups_in(dir);
  print_json({{"directory", dir},
              {"threshold", threshold},
              {"group_count", groups.size()},
              {"groups", groups}});
  return 0;
}

int dedup_inbound_command(const std::string &input_dir, const std::string &archive_dir,
                          double threshold, int workers) {
  core::WorkerPool pool(workers);
  dedup::DuplicateDetector detector(threshold, &pool);
  print_json(detector.scan_inbound(fs::path(input_dir), fs::path(archive_dir)));
  return 0;
}

int enhance_command(const std::string &input, const std::string &output_stem,
                    const std::string &preset_name, const std::string &config_path) {
  const config::Config cfg = load_config(config_path);
  image::EnhancementEngine engine(image::EnhancementSettings::from_config(cfg.enhancement),
                                  cfg.enhancement.face_cascade);

  const cv::Mat img = image::EnhancementEngine::load(input);
  EnhancementResult result;
  if (preset_name == "auto") {
    result = engine.enhance_auto(img);
  } else if (preset_name.empty()) {
    result = engine.enhance(img);
  } else {
    const auto preset = find_preset(preset_name);
    if (!preset) {
      throw ValidationError("Unknown preset: " + preset_name);
    }
    result = engine.enhance(img, *preset);
  }

  const fs::path stem(output_stem);
  if (stem.has_parent_path()) {
    core::ensure_directory(stem.parent_path());
  }
  const auto saved = engine.save(result, stem, image::SaveOptions::from_config(cfg.output));
  print_json({{"input", input}, {"outputs", saved_outputs_to_json(saved)}, {"result", result}});
  return 0;
}

int init_config_command(const std::string &path) {
  if (fs::exists(path)) {
    std::cerr << "Refusing to overwrite existing file: " << path << std::endl;
    return 1;
  }
  config::Config{}.save(path);
  std::cout << "Wrote default configuration to " << path << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"slide_ingest - film scan ingestion pipeline"};
  app.require_subcommand(1);

  std::string config_path, file, dir, input_dir, archive_dir, input, output_stem,
      preset_name, init_path;
  bool archived = false;
  double threshold = 0.95;
  int workers = 2;

  auto run_cmd = app.add_subcommand("run", "Watch input directories and process scans");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")->required();

  auto process_cmd = app.add_subcommand("process", "Process a single file");
  process_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  process_cmd->add_option("file", file, "Scan to ingest")->required();
  process_cmd->add_flag("--archived", archived,
                        "File is already in the archive; skip ingestion");

  auto recover_cmd = app.add_subcommand("recover", "Process archived scans without output");
  recover_cmd->add_option("--config", config_path, "Path to config.yaml")->required();

  auto dedup_cmd = app.add_subcommand("dedup", "Group duplicate images in a directory");
  dedup_cmd->add_option("--dir", dir, "Directory to scan")->required();
  dedup_cmd->add_option("--threshold", threshold, "Similarity threshold (0,1]")
      ->check(CLI::Range(0.0, 1.0));
  dedup_cmd->add_option("--workers", workers, "Hashing threads")->check(CLI::PositiveNumber);

  auto inbound_cmd = app.add_subcommand("dedup-inbound", "Match input scans against the archive");
  inbound_cmd->add_option("--input", input_dir, "Input directory")->required();
  inbound_cmd->add_option("--archive", archive_dir, "Archive directory")->required();
  inbound_cmd->add_option("--threshold", threshold, "Similarity threshold (0,1]")
      ->check(CLI::Range(0.0, 1.0));
  inbound_cmd->add_option("--workers", workers, "Hashing threads")->check(CLI::PositiveNumber);

  auto enhance_cmd = app.add_subcommand("enhance", "Enhance one image without ingesting it");
  enhance_cmd->add_option("input", input, "Input image")->required();
  enhance_cmd->add_option("output_stem", output_stem, "Output path without extension")
      ->required();
  enhance_cmd->add_option("--preset", preset_name,
                          "gentle|balanced|aggressive|auto (default: configured parameters)");
  enhance_cmd->add_option("--config", config_path, "Path to config.yaml");

  auto init_cmd = app.add_subcommand("init-config", "Write a default config.yaml");
  init_cmd->add_option("path", init_path, "Destination")->required();

  CLI11_PARSE(app, argc, argv);

  try {
    if (run_cmd->parsed())
      return run_command(config_path);
    if (process_cmd->parsed())
      return process_command(config_path, file, archived);
    if (recover_cmd->parsed())
      return recover_command(config_path);
    if (dedup_cmd->parsed())
      return dedup_command(dir, threshold, workers);
    if (inbound_cmd->parsed())
      return dedup_inbound_command(input_dir, archive_dir, threshold, workers);
    if (enhance_cmd->parsed())
      return enhance_command(input, output_stem, preset_name, config_path);
    if (init_cmd->parsed())
      return init_config_command(init_path);
  } catch (const slide_ingest::SlideIngestError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Unexpected error: " << e.what() << std::endl;
    return 2;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
