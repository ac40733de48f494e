#include "slide_ingest/config/configuration.hpp"
#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/core/events.hpp"
#include "slide_ingest/pipeline/collaborators.hpp"
#include "slide_ingest/pipeline/orchestrator.hpp"
#include "test_helpers.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace slide_ingest;
using slide_ingest::test::TempDir;
using slide_ingest::test::write_text;

namespace {

struct Upsert {
  fs::path original;
  fs::path archived;
  fs::path enhanced;
  std::vector<Tag> tags;
  float quality = 0.0f;
};

class RecordingSink : public pipeline::PersistenceSink {
public:
  void upsert(const fs::path &original, const fs::path &archived, const fs::path &enhanced,
              const EnhancementResult &result, const std::vector<Tag> &tags) override {
    std::lock_guard<std::mutex> lock(mutex);
    upserts.push_back({original, archived, enhanced, tags, result.quality_score});
  }

  void remove(const std::string &filename) override {
    std::lock_guard<std::mutex> lock(mutex);
    removed.push_back(filename);
  }

  size_t removed_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return removed.size();
  }

  std::mutex mutex;
  std::vector<Upsert> upserts;
  std::vector<std::string> removed;
};

class FailingSink : public pipeline::PersistenceSink {
public:
  void upsert(const fs::path &, const fs::path &, const fs::path &, const EnhancementResult &,
              const std::vector<Tag> &) override {
    throw IOError("catalog is read-only");
  }
  void remove(const std::string &) override {}
};

class RecordingStatus : public pipeline::StatusSink {
public:
  void publish(const pipeline::StatusUpdate &update) override {
    std::lock_guard<std::mutex> lock(mutex);
    updates.push_back(update);
  }

  std::mutex mutex;
  std::vector<pipeline::StatusUpdate> updates;
};

class ThrowingStatus : public pipeline::StatusSink {
public:
  void publish(const pipeline::StatusUpdate &) override { throw std::runtime_error("status down"); }
};

class FixedTagger : public pipeline::Tagger {
public:
  explicit FixedTagger(bool fail) : fail_(fail) {}
  bool available() const override { return true; }
  std::vector<Tag> generate_tags(const fs::path &) override {
    if (fail_) throw ModelUnavailable("no model");
    return {{"beach", 0.8f, "scene"}};
  }

private:
  bool fail_;
};

struct Workspace {
  TempDir root{"orchestrator"};
  config::Config cfg;
  std::ostringstream events_out;
  core::EventEmitter events{"test_run", events_out};
  RecordingSink sink;

  Workspace() {
    cfg.paths.input_dirs = {(root / "input").string()};
    cfg.paths.archive_dir = (root / "archive").string();
    cfg.paths.output_dir = (root / "output").string();
    cfg.paths.logs_dir = (root / "logs").string();
    cfg.paths.catalog_file = (root / "catalog.jsonl").string();
    cfg.enhancement.face_detection = false;
    cfg.enhancement.auto_quality = false;
    cfg.watcher.debounce_seconds = 0.1f;
    cfg.watcher.poll_interval_ms = 20;
    cfg.watcher.output_debounce_seconds = 0.05f;
    cfg.runtime.workers = 1;
    fs::create_directories(cfg.paths.input_dirs[0]);
  }

  fs::path input(const std::string &name) const { return fs::path(cfg.paths.input_dirs[0]) / name; }
  fs::path archive() const { return cfg.paths.archive_dir; }
  fs::path output() const { return cfg.paths.output_dir; }

  std::string events() const { return events_out.str(); }
};

cv::Mat scene(int variant = 0) {
  cv::Mat img(240, 320, CV_8UC3);
  cv::RNG rng(100 + variant);
  rng.fill(img, cv::RNG::UNIFORM, cv::Scalar::all(60), cv::Scalar::all(190));
  cv::circle(img, cv::Point(100 + 20 * variant, 120), 50, cv::Scalar(30, 160, 220), cv::FILLED);
  return img;
}

void write_image(const fs::path &p, const cv::Mat &img) {
  fs::create_directories(p.parent_path());
  REQUIRE(cv::imwrite(p.string(), img));
}

// Uncompressed single-strip 16-bit gray TIFF carrying DateTime in IFD0 and
// DateTimeOriginal in the Exif IFD.
void write_scan_tiff(const fs::path &p, int width, int height, const std::string &taken) {
  std::string out;
  auto u16 = [&out](uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>(v >> 8));
  };
  auto u32 = [&out](uint32_t v) {
    for (int i = 0; i < 4; ++i)
      out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  };
  auto entry = [&](uint16_t tag, uint16_t type, uint32_t count, uint32_t value) {
    u16(tag);
    u16(type);
    u32(count);
    u32(value);
  };
  auto ascii20 = [&out](const std::string &s) {
    std::string v = s;
    v.resize(20, '\0');
    out += v;
  };

  const uint16_t kShort = 3, kLong = 4, kAscii = 2;
  const uint32_t w = static_cast<uint32_t>(width);
  const uint32_t h = static_cast<uint32_t>(height);
  const uint32_t ifd0 = 8;
  const uint32_t exif_ifd = ifd0 + 2 + 11 * 12 + 4;    // 146
  const uint32_t datetime_at = exif_ifd + 2 + 12 + 4;  // 164
  const uint32_t original_at = datetime_at + 20;       // 184
  const uint32_t pixels_at = original_at + 20;         // 204

  out += "II";
  u16(42);
  u32(ifd0);

  u16(11);
  entry(256, kLong, 1, w);
  entry(257, kLong, 1, h);
  entry(258, kShort, 1, 16);
  entry(259, kShort, 1, 1);
  entry(262, kShort, 1, 1);
  entry(273, kLong, 1, pixels_at);
  entry(277, kShort, 1, 1);
  entry(278, kLong, 1, h);
  entry(279, kLong, 1, w * h * 2);
  entry(306, kAscii, 20, datetime_at);
  entry(34665, kLong, 1, exif_ifd);
  u32(0);

  u16(1);
  entry(36867, kAscii, 20, original_at);
  u32(0);

  ascii20(taken);
  ascii20(taken);

  out.reserve(out.size() + static_cast<size_t>(w) * h * 2);
  for (uint32_t y = 0; y < h; ++y) {
    for (uint32_t x = 0; x < w; ++x) {
      u16(static_cast<uint16_t>(2000 + x * 50000 / w + y * 8000 / h));
    }
  }
  write_text(p, out);
}

template <typename Pred> bool wait_for(Pred done, std::chrono::seconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return true;
}

size_t count_files(const fs::path &dir) {
  size_t n = 0;
  std::error_code ec;
  for (const auto &e : fs::directory_iterator(dir, ec)) {
    if (e.is_regular_file()) ++n;
  }
  return n;
}

} // namespace

TEST_CASE("process_file_ingests_enhances_and_persists") {
  Workspace ws;
  RecordingStatus status;
  write_image(ws.input("scan001.jpg"), scene());

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events, nullptr, &status);
  REQUIRE(orch.process_file(ws.input("scan001.jpg")) == pipeline::FileOutcome::COMPLETED);

  REQUIRE_FALSE(fs::exists(ws.input("scan001.jpg")));
  REQUIRE(count_files(ws.archive()) == 1);
  REQUIRE(ws.sink.upserts.size() == 1);

  const auto &u = ws.sink.upserts[0];
  REQUIRE(u.original == ws.input("scan001.jpg"));
  REQUIRE(u.archived.parent_path() == ws.archive());
  REQUIRE(u.archived.filename().string().rfind("image_", 0) == 0);
  REQUIRE(u.enhanced == ws.output() / (u.archived.stem().string() + ".jpg"));
  REQUIRE(fs::exists(u.enhanced));
  REQUIRE(u.tags.empty());

  REQUIRE(orch.stats().processed() == 1);
  REQUIRE(orch.stats().errors() == 0);
  REQUIRE_FALSE(orch.stats().current().processing);

  REQUIRE(status.updates.size() == 5);
  REQUIRE(status.updates.front().stage == Stage::INGESTING);
  REQUIRE(status.updates.back().stage == Stage::COMPLETE);
  REQUIRE(status.updates.back().file == u.archived.filename().string());
  REQUIRE(ws.events().find("\"type\":\"file_complete\"") != std::string::npos);
}

TEST_CASE("failed_file_is_recorded_and_next_file_still_processes") {
  Workspace ws;
  RecordingStatus status;
  write_text(ws.input("corrupt.tif"), "this is not a tiff");
  write_image(ws.input("good.jpg"), scene());

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events, nullptr, &status);
  REQUIRE(orch.process_file(ws.input("corrupt.tif")) == pipeline::FileOutcome::FAILED);
  REQUIRE(orch.process_file(ws.input("good.jpg")) == pipeline::FileOutcome::COMPLETED);

  REQUIRE(orch.stats().processed() == 1);
  REQUIRE(orch.stats().errors() == 1);
  const auto log = orch.stats().error_log();
  REQUIRE(log.size() == 1);
  REQUIRE(log[0].filename == "corrupt.tif");
  REQUIRE(log[0].stage == "enhancement");

  bool saw_error = false;
  for (const auto &u : status.updates) {
    if (u.stage == Stage::ERROR) {
      saw_error = true;
      REQUIRE_FALSE(u.error.empty());
    }
  }
  REQUIRE(saw_error);
  REQUIRE(ws.sink.upserts.size() == 1);
  REQUIRE(ws.events().find("\"type\":\"file_error\"") != std::string::npos);
}

TEST_CASE("status_and_tagger_failures_do_not_fail_the_file") {
  Workspace ws;
  ThrowingStatus status;
  FixedTagger broken(true);
  write_image(ws.input("a.jpg"), scene());

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events, &broken, &status);
  REQUIRE(orch.process_file(ws.input("a.jpg")) == pipeline::FileOutcome::COMPLETED);
  REQUIRE(ws.sink.upserts.size() == 1);
  REQUIRE(ws.sink.upserts[0].tags.empty());
}

TEST_CASE("tags_are_passed_to_persistence") {
  Workspace ws;
  FixedTagger tagger(false);
  write_image(ws.input("a.jpg"), scene());

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events, &tagger);
  REQUIRE(orch.process_file(ws.input("a.jpg")) == pipeline::FileOutcome::COMPLETED);
  REQUIRE(ws.sink.upserts.size() == 1);
  REQUIRE(ws.sink.upserts[0].tags.size() == 1);
  REQUIRE(ws.sink.upserts[0].tags[0].label == "beach");
}

TEST_CASE("exact_inbound_duplicate_is_skipped_when_enabled") {
  Workspace ws;
  ws.cfg.duplicates.auto_skip = true;
  const cv::Mat img = scene();
  write_image(ws.archive() / "image_240210_143215.jpg", img);
  write_image(ws.input("rescan.jpg"), img);
  write_image(ws.input("other.jpg"), scene(3));

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  REQUIRE(orch.process_file(ws.input("rescan.jpg")) == pipeline::FileOutcome::SKIPPED);
  REQUIRE(fs::exists(ws.input("rescan.jpg")));
  REQUIRE(ws.sink.upserts.empty());
  REQUIRE(ws.events().find("\"type\":\"duplicate_scan\"") != std::string::npos);

  // the skipped file stays in the input directory but is not backlog
  REQUIRE(orch.pending_count() == 1);

  REQUIRE(orch.process_file(ws.input("other.jpg")) == pipeline::FileOutcome::COMPLETED);
  REQUIRE(orch.pending_count() == 0);
}

TEST_CASE("sixteen_bit_scan_is_archived_by_capture_time_and_enhanced") {
  Workspace ws;
  write_scan_tiff(ws.input("scan002.tif"), 3600, 2400, "2024:02:10 14:32:15");

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  REQUIRE(orch.process_file(ws.input("scan002.tif")) == pipeline::FileOutcome::COMPLETED);

  const fs::path archived = ws.archive() / "image_240210_143215.tif";
  const fs::path jpg = ws.output() / "image_240210_143215.jpg";
  REQUIRE(fs::exists(archived));
  REQUIRE_FALSE(fs::exists(ws.input("scan002.tif")));

  const cv::Mat out = cv::imread(jpg.string());
  REQUIRE(out.cols == 3600);
  REQUIRE(out.rows == 2400);
  REQUIRE(out.type() == CV_8UC3);

  REQUIRE(ws.sink.upserts.size() == 1);
  REQUIRE(ws.sink.upserts[0].archived == archived);
  REQUIRE(ws.sink.upserts[0].enhanced == jpg);
  REQUIRE(ws.sink.upserts[0].quality >= 0.0f);
  REQUIRE(ws.sink.upserts[0].quality <= 100.0f);
}

TEST_CASE("reused_input_name_with_new_content_is_processed") {
  Workspace ws;
  ws.cfg.duplicates.auto_skip = true;
  write_image(ws.archive() / "image_230101_090000.jpg", scene(5));

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);

  write_image(ws.input("scan002.jpg"), scene(1));
  REQUIRE(orch.process_file(ws.input("scan002.jpg")) == pipeline::FileOutcome::COMPLETED);

  // next batch from the scanner starts numbering again
  write_image(ws.input("scan002.jpg"), scene(3));
  REQUIRE(orch.process_file(ws.input("scan002.jpg")) == pipeline::FileOutcome::COMPLETED);

  REQUIRE(ws.sink.upserts.size() == 2);
  REQUIRE(count_files(ws.archive()) == 3);
}

TEST_CASE("persistence_failure_removes_outputs_so_recovery_retries") {
  Workspace ws;
  FailingSink failing;
  write_image(ws.input("scan.tif"), scene(2));

  {
    pipeline::Orchestrator orch(ws.cfg, failing, ws.events);
    REQUIRE(orch.process_file(ws.input("scan.tif")) == pipeline::FileOutcome::FAILED);
    REQUIRE(count_files(ws.output()) == 0);
    REQUIRE(orch.pending_count() == 1);
    REQUIRE(orch.stats().error_log().at(0).stage == "tagging");
  }

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  REQUIRE(orch.recover_unprocessed() == 1);
  REQUIRE(ws.sink.upserts.size() == 1);
  REQUIRE(count_files(ws.output()) == 1);
}

TEST_CASE("pending_count_does_not_double_count_queued_files") {
  Workspace ws;
  write_image(ws.input("a.jpg"), scene(1));

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  REQUIRE(orch.pending_count() == 1);

  orch.enqueue(ws.input("a.jpg"));
  REQUIRE(orch.queued() == 1);
  REQUIRE(orch.pending_count() == 1);
}

TEST_CASE("recover_unprocessed_handles_archive_without_output") {
  Workspace ws;
  write_image(ws.archive() / "image_240101_100000.tif", scene(1));
  write_image(ws.archive() / "image_240101_110000.tif", scene(2));
  write_image(ws.output() / "image_240101_110000.jpg", scene(2));
  write_image(ws.input("waiting.jpg"), scene(4));

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  REQUIRE(orch.pending_count() == 2);

  REQUIRE(orch.recover_unprocessed() == 1);
  REQUIRE(fs::exists(ws.output() / "image_240101_100000.jpg"));
  REQUIRE(ws.sink.upserts.size() == 1);
  REQUIRE(ws.sink.upserts[0].original == ws.sink.upserts[0].archived);
  REQUIRE(orch.pending_count() == 1);

  REQUIRE(orch.recover_unprocessed() == 0);
}

TEST_CASE("output_deletion_removes_catalog_entry") {
  Workspace ws;
  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);

  orch.handle_output_deletion(ws.output() / "image_240210_143215.jpg");
  REQUIRE(ws.sink.removed.size() == 1);
  REQUIRE(ws.sink.removed[0] == "image_240210_143215.jpg");
  REQUIRE(ws.events().find("\"type\":\"file_deleted\"") != std::string::npos);
}

TEST_CASE("telemetry_and_alerts_follow_stats") {
  Workspace ws;
  write_text(ws.input("bad.tif"), "nope");

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  orch.process_file(ws.input("bad.tif"));

  const auto snap = orch.telemetry();
  REQUIRE(snap.errors == 1);
  REQUIRE(snap.pending == 1);  // the archived copy still has no output

  orch.publish_alerts();
  orch.publish_alerts();
  const std::string out = ws.events();
  const auto first = out.find("\"alert_type\":\"all_errors\"");
  REQUIRE(first != std::string::npos);
  REQUIRE(out.find("\"alert_type\":\"all_errors\"", first + 1) == std::string::npos);
}

TEST_CASE("running_pipeline_picks_up_existing_and_new_scans") {
  Workspace ws;
  write_image(ws.input("existing.jpg"), scene(1));

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  orch.start();
  REQUIRE(orch.running());
  REQUIRE_THROWS_AS(orch.start(), PipelineError);

  write_image(ws.input("arrived.jpg"), scene(2));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
  while (orch.stats().processed() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  orch.stop();
  orch.stop();

  REQUIRE_FALSE(orch.running());
  REQUIRE(orch.stats().processed() == 2);
  REQUIRE(count_files(ws.output()) == 2);
  REQUIRE(orch.supervisor().failures().empty());
}

TEST_CASE("queued_batch_raises_no_stall_warning") {
  Workspace ws;
  write_image(ws.input("a.jpg"), scene(1));
  write_image(ws.input("b.jpg"), scene(2));

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  orch.enqueue(ws.input("a.jpg"));
  orch.enqueue(ws.input("b.jpg"));
  orch.start();
  const bool drained = wait_for([&orch]() { return orch.stats().processed() >= 2; },
                                std::chrono::seconds(30));
  orch.stop();

  REQUIRE(drained);
  REQUIRE(orch.stats().processed() == 2);
  REQUIRE(ws.events().find("stall_warning") == std::string::npos);
}

TEST_CASE("deleting_an_output_file_removes_its_catalog_entry") {
  Workspace ws;
  write_image(ws.input("a.jpg"), scene(1));

  pipeline::Orchestrator orch(ws.cfg, ws.sink, ws.events);
  REQUIRE(orch.process_file(ws.input("a.jpg")) == pipeline::FileOutcome::COMPLETED);
  const fs::path jpg = ws.sink.upserts.at(0).enhanced;

  orch.start();
  fs::remove(jpg);
  const bool removed = wait_for([&ws]() { return ws.sink.removed_count() > 0; },
                                std::chrono::seconds(10));
  orch.stop();

  REQUIRE(removed);
  REQUIRE(ws.sink.removed.at(0) == jpg.filename().string());
  REQUIRE(ws.events().find("\"type\":\"file_deleted\"") != std::string::npos);
}

TEST_CASE("jsonl_catalog_replays_upserts_and_deletes") {
  TempDir dir("catalog");
  pipeline::JsonlCatalog catalog(dir / "db/catalog.jsonl");

  EnhancementResult result;
  result.quality_score = 61.5f;
  catalog.upsert("/in/a.tif", "/archive/image_1.tif", dir / "image_1.jpg", result, {});
  catalog.upsert("/in/b.tif", "/archive/image_2.tif", dir / "image_2.jpg", result,
                 {{"portrait", 0.9f, "people"}});
  catalog.remove("image_1.jpg");

  {
    std::ofstream out(catalog.file(), std::ios::app);
    out << "{not json\n";
    out << "{\"op\":\"upsert\",\"filename\":5}\n";
    out << "[1,2]\n";
  }

  const auto entries = catalog.entries();
  REQUIRE(entries.size() == 1);
  const auto &e = entries.at("image_2.jpg");
  REQUIRE(e["archived_path"] == "/archive/image_2.tif");
  REQUIRE(e["status"] == "complete");
  REQUIRE(e["tags"].size() == 1);
}
