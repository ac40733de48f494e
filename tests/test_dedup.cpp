#include "slide_ingest/core/worker_pool.hpp"
#include "slide_ingest/dedup/duplicate_detector.hpp"
#include "test_helpers.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <chrono>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace slide_ingest;
using slide_ingest::test::TempDir;

namespace {

cv::Mat noise(uint64_t seed) {
  cv::Mat img(256, 256, CV_8UC3);
  cv::RNG rng(seed);
  rng.fill(img, cv::RNG::UNIFORM, cv::Scalar::all(30), cv::Scalar::all(220));
  return img;
}

// Gradient with a few shapes; brightness shifts keep the pHash unchanged
cv::Mat scene(int shift = 0) {
  cv::Mat img(300, 400, CV_8UC3);
  for (int y = 0; y < img.rows; ++y) {
    for (int x = 0; x < img.cols; ++x) {
      const auto v = static_cast<uchar>(40 + x / 4 + y / 6 + shift);
      img.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
    }
  }
  cv::circle(img, cv::Point(120, 140), 60, cv::Scalar::all(200 + shift), cv::FILLED);
  cv::rectangle(img, cv::Rect(250, 40, 90, 200), cv::Scalar::all(20 + shift), cv::FILLED);
  return img;
}

void save(const fs::path &p, const cv::Mat &img) {
  fs::create_directories(p.parent_path());
  REQUIRE(cv::imwrite(p.string(), img));
}

} // namespace

TEST_CASE("similarity_counts_differing_bits") {
  const std::string a(64, 'f');
  std::string one_bit = a;
  one_bit[0] = 'e';
  std::string eight_bits = a;
  eight_bits[0] = '0';
  eight_bits[1] = '0';

  REQUIRE(dedup::similarity(a, a) == 1.0);
  REQUIRE(dedup::similarity(a, one_bit) == Catch::Approx(1.0 - 1.0 / 256.0));
  REQUIRE(dedup::similarity(a, eight_bits) == Catch::Approx(0.96875));
  REQUIRE(dedup::similarity(a, std::string(64, '0')) == 0.0);

  REQUIRE(dedup::similarity("", a) == 0.0);
  REQUIRE(dedup::similarity(a, "ff") == 0.0);
  REQUIRE(dedup::similarity(std::string(64, 'z'), a) == 0.0);
}

TEST_CASE("compute_hash_has_256_bits_and_ignores_brightness_shift") {
  const std::string h = dedup::compute_hash(scene());
  REQUIRE(h.size() == 64);
  REQUIRE(h == dedup::compute_hash(scene(10)));
  REQUIRE(dedup::compute_hash(cv::Mat()).empty());

  REQUIRE(dedup::similarity(dedup::compute_hash(noise(1)), dedup::compute_hash(noise(2))) < 0.8);
}

TEST_CASE("hash_of_undecodable_file_is_empty") {
  TempDir dir("dedup_bad");
  slide_ingest::test::write_text(dir / "broken.jpg", "garbage");
  REQUIRE(dedup::compute_hash(dir / "broken.jpg").empty());
  REQUIRE(dedup::compute_hash(dir / "missing.jpg").empty());
}

TEST_CASE("find_groups_collects_identical_copies_once") {
  TempDir dir("dedup_groups");
  save(dir / "a.png", scene());
  save(dir / "b.png", scene());
  save(dir / "c.png", scene(15));
  save(dir / "d.png", noise(3));
  save(dir / "e.png", noise(4));
  slide_ingest::test::write_text(dir / "f.jpg", "garbage");

  dedup::DuplicateDetector detector(0.95);
  const auto groups = detector.find_groups_in(dir.path());

  REQUIRE(groups.size() == 1);
  const auto &g = groups[0];
  REQUIRE(g.seed.filename() == "a.png");
  REQUIRE(g.matches.size() == 2);
  REQUIRE(g.mean_similarity == Catch::Approx(1.0));
  REQUIRE(g.kind == DuplicateKind::EXACT);
  REQUIRE(g.action == DuplicateAction::SKIP);
  REQUIRE(detector.cache_size() == 6);
}

TEST_CASE("find_groups_deduplicates_input_paths") {
  TempDir dir("dedup_repeat");
  save(dir / "a.png", scene());

  dedup::DuplicateDetector detector;
  REQUIRE(detector.find_groups({dir / "a.png", dir / "a.png", dir / "a.png"}).empty());
}

TEST_CASE("hash_cache_is_reused_and_clearable") {
  TempDir dir("dedup_cache");
  save(dir / "a.png", scene());

  dedup::DuplicateDetector detector;
  const std::string first = detector.hash_for(dir / "a.png");
  REQUIRE(detector.hash_for(dir / "a.png") == first);
  REQUIRE(detector.cache_size() == 1);

  detector.clear_cache();
  REQUIRE(detector.cache_size() == 0);
  REQUIRE(detector.hash_for(dir / "a.png") == first);
}

TEST_CASE("hash_cache_rehashes_file_replaced_under_same_name") {
  TempDir dir("dedup_replaced");
  const fs::path p = dir / "scan002.png";
  save(p, scene());

  dedup::DuplicateDetector detector;
  const std::string before = detector.hash_for(p);
  const auto written = fs::last_write_time(p);

  save(p, noise(7));
  fs::last_write_time(p, written + std::chrono::seconds(2));
  const std::string after = detector.hash_for(p);

  REQUIRE_FALSE(after.empty());
  REQUIRE(after != before);
  REQUIRE(after == dedup::compute_hash(p));
  REQUIRE(detector.cache_size() == 1);

  fs::remove(p);
  REQUIRE(detector.hash_for(p).empty());
  REQUIRE(detector.cache_size() == 0);
}

TEST_CASE("evict_drops_a_single_path") {
  TempDir dir("dedup_evict");
  save(dir / "a.png", scene());
  save(dir / "b.png", noise(3));

  dedup::DuplicateDetector detector;
  detector.hash_for(dir / "a.png");
  detector.hash_for(dir / "b.png");
  detector.evict(dir / "a.png");
  REQUIRE(detector.cache_size() == 1);
}

TEST_CASE("scan_inbound_skips_exact_archive_matches") {
  TempDir input("dedup_in");
  TempDir archive("dedup_archive");
  save(archive / "image_240210_143215.png", scene());
  save(archive / "image_240211_090000.png", noise(9));
  save(input / "rescan.png", scene(5));
  save(input / "fresh.png", noise(10));

  core::WorkerPool pool(2);
  dedup::DuplicateDetector detector(0.95, &pool);
  const auto report = detector.scan_inbound(input.path(), archive.path());

  REQUIRE(report.total_input == 2);
  REQUIRE(report.skip_count == 1);
  REQUIRE(report.alert_count == 0);
  REQUIRE(report.records.size() == 1);
  REQUIRE(report.records[0].input.filename() == "rescan.png");
  REQUIRE(report.records[0].match.filename() == "image_240210_143215.png");
  REQUIRE(report.records[0].kind == DuplicateKind::EXACT);
  REQUIRE(report.records[0].action == DuplicateAction::SKIP);
}

TEST_CASE("match_inbound_never_matches_the_file_itself") {
  TempDir dir("dedup_self");
  save(dir / "only.png", scene());

  dedup::DuplicateDetector detector;
  REQUIRE_FALSE(detector.match_inbound(dir / "only.png", {dir / "only.png"}).has_value());
}
