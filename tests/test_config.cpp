#include "slide_ingest/config/configuration.hpp"
#include "slide_ingest/core/errors.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace slide_ingest;
using slide_ingest::test::TempDir;
using slide_ingest::test::write_text;

TEST_CASE("config_defaults_are_valid") {
  config::Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.paths.input_dirs.size() == 1);
  REQUIRE(cfg.enhancement.histogram_clip == Catch::Approx(0.5f));
  REQUIRE(cfg.enhancement.clahe_clip == Catch::Approx(1.5f));
  REQUIRE(cfg.output.jpeg_quality == 95);
  REQUIRE(cfg.duplicates.threshold == Catch::Approx(0.95f));
}

TEST_CASE("config_from_yaml_overrides_sections") {
  const auto node = YAML::Load(R"(
paths:
  input_dirs: [/scans/a, /scans/b]
  archive_dir: /archive
  output_dir: /out
enhancement:
  clahe_clip: 2.5
  face_detection: false
output:
  jpeg_quality: 90
  tiff_archive: true
duplicates:
  threshold: 0.9
  auto_skip: true
watcher:
  debounce_seconds: 1.5
runtime:
  workers: 4
)");
  const auto cfg = config::Config::from_yaml(node);

  REQUIRE(cfg.paths.input_dirs.size() == 2);
  REQUIRE(cfg.paths.input_dirs[1] == "/scans/b");
  REQUIRE(cfg.paths.archive_dir == "/archive");
  REQUIRE(cfg.enhancement.clahe_clip == Catch::Approx(2.5f));
  REQUIRE_FALSE(cfg.enhancement.face_detection);
  REQUIRE(cfg.enhancement.histogram_clip == Catch::Approx(0.5f));
  REQUIRE(cfg.output.jpeg_quality == 90);
  REQUIRE(cfg.output.tiff_archive);
  REQUIRE(cfg.duplicates.auto_skip);
  REQUIRE(cfg.watcher.debounce_seconds == Catch::Approx(1.5f));
  REQUIRE(cfg.runtime.workers == 4);
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_scalar_input_dir_is_accepted") {
  const auto cfg = config::Config::from_yaml(YAML::Load("paths:\n  input_dirs: /scans\n"));
  REQUIRE(cfg.paths.input_dirs.size() == 1);
  REQUIRE(cfg.paths.input_dirs[0] == "/scans");
}

TEST_CASE("config_validate_rejects_out_of_range_values") {
  config::Config cfg;

  SECTION("no input directories") { cfg.paths.input_dirs.clear(); }
  SECTION("archive equals output") { cfg.paths.output_dir = cfg.paths.archive_dir; }
  SECTION("histogram clip too large") { cfg.enhancement.histogram_clip = 50.0f; }
  SECTION("non-positive clahe clip") { cfg.enhancement.clahe_clip = 0.0f; }
  SECTION("jpeg quality") { cfg.output.jpeg_quality = 101; }
  SECTION("zero threshold") { cfg.duplicates.threshold = 0.0f; }
  SECTION("workers") { cfg.runtime.workers = 0; }

  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_load_errors_are_config_errors") {
  TempDir dir("config");
  REQUIRE_THROWS_AS(config::Config::load(dir / "missing.yaml"), ConfigError);

  write_text(dir / "broken.yaml", "paths: [unclosed\n");
  REQUIRE_THROWS_AS(config::Config::load(dir / "broken.yaml"), ConfigError);

  write_text(dir / "mistyped.yaml", "runtime:\n  workers: many\n");
  REQUIRE_THROWS_AS(config::Config::load(dir / "mistyped.yaml"), ConfigError);
}

TEST_CASE("config_save_then_load_preserves_values") {
  TempDir dir("config_save");
  config::Config cfg;
  cfg.paths.input_dirs = {"/in1", "/in2"};
  cfg.enhancement.auto_quality = false;
  cfg.output.jpeg_quality = 80;
  cfg.runtime.workers = 3;
  cfg.save(dir / "config.yaml");

  const auto loaded = config::Config::load(dir / "config.yaml");
  REQUIRE(loaded.paths.input_dirs == cfg.paths.input_dirs);
  REQUIRE_FALSE(loaded.enhancement.auto_quality);
  REQUIRE(loaded.output.jpeg_quality == 80);
  REQUIRE(loaded.runtime.workers == 3);
}
