#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/ingest/ingest_namer.hpp"
#include "slide_ingest/io/exif_reader.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace slide_ingest;
using slide_ingest::test::TempDir;
using slide_ingest::test::write_text;

namespace {

// Little-endian TIFF header + IFD0 (DateTime, ExifIFD pointer) + Exif IFD
// (DateTimeOriginal). Values are 20-byte ASCII strings stored after the IFDs.
std::string make_tiff(const std::string &datetime, const std::string &original) {
  std::string out;
  auto u16 = [&out](uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>(v >> 8));
  };
  auto u32 = [&out](uint32_t v) {
    for (int i = 0; i < 4; ++i)
      out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  };
  auto ascii20 = [&out](const std::string &s) {
    std::string v = s;
    v.resize(20, '\0');
    out += v;
  };

  const uint32_t ifd0 = 8;
  const uint32_t exif_ifd = ifd0 + 2 + 2 * 12 + 4;      // 38
  const uint32_t datetime_at = exif_ifd + 2 + 12 + 4;   // 56
  const uint32_t original_at = datetime_at + 20;        // 76

  out += "II";
  u16(42);
  u32(ifd0);

  u16(2);
  u16(0x0132); u16(2); u32(20); u32(datetime_at);
  u16(0x8769); u16(4); u32(1); u32(exif_ifd);
  u32(0);

  u16(1);
  u16(0x9003); u16(2); u32(20); u32(original_at);
  u32(0);

  ascii20(datetime);
  ascii20(original);
  return out;
}

std::string make_jpeg(const std::string &tiff) {
  const std::string payload = std::string("Exif\0\0", 6) + tiff;
  const size_t length = payload.size() + 2;

  std::string out;
  out += "\xFF\xD8";
  out += "\xFF\xE0";  // APP0 stub
  out += std::string("\x00\x04\x00\x00", 4);
  out += "\xFF\xE1";
  out.push_back(static_cast<char>((length >> 8) & 0xFF));
  out.push_back(static_cast<char>(length & 0xFF));
  out += payload;
  out += "\xFF\xDA";
  return out;
}

} // namespace

TEST_CASE("exif_tiff_reads_all_date_tags") {
  std::istringstream in(make_tiff("2023:01:05 08:00:00", "2024:02:10 14:32:15"));
  const auto dt = io::parse_tiff_datetimes(in);

  REQUIRE(dt.datetime.has_value());
  REQUIRE(*dt.datetime == "2023:01:05 08:00:00");
  REQUIRE(dt.original.has_value());
  REQUIRE(*dt.original == "2024:02:10 14:32:15");
  REQUIRE_FALSE(dt.digitized.has_value());
}

TEST_CASE("exif_jpeg_app1_segment_is_found") {
  TempDir dir("exif_jpeg");
  write_text(dir / "scan.jpg", make_jpeg(make_tiff("2023:01:05 08:00:00", "2024:02:10 14:32:15")));

  const auto dt = io::read_exif_datetimes(dir / "scan.jpg");
  REQUIRE(dt.original.has_value());
  REQUIRE(*dt.original == "2024:02:10 14:32:15");
}

TEST_CASE("exif_garbage_yields_empty_result") {
  TempDir dir("exif_garbage");
  write_text(dir / "junk.tif", "not an image at all");
  write_text(dir / "short.tif", "I");
  write_text(dir / "truncated.tif", make_tiff("2023:01:05 08:00:00", "x").substr(0, 30));

  REQUIRE(io::read_exif_datetimes(dir / "junk.tif").empty());
  REQUIRE(io::read_exif_datetimes(dir / "short.tif").empty());
  REQUIRE_FALSE(io::read_exif_datetimes(dir / "truncated.tif").original.has_value());
  REQUIRE_THROWS_AS(io::read_exif_datetimes(dir / "missing.tif"), IOError);
}

TEST_CASE("exif_datetime_parsing") {
  REQUIRE(io::parse_exif_datetime("2024:02:10 14:32:15").has_value());
  REQUIRE_FALSE(io::parse_exif_datetime("0000:00:00 00:00:00").has_value());
  REQUIRE_FALSE(io::parse_exif_datetime("2024-02-10").has_value());
  REQUIRE_FALSE(io::parse_exif_datetime("").has_value());

  const auto tp = io::parse_exif_datetime("2024:02:10 14:32:15");
  REQUIRE(ingest::base_name(*tp) == "image_240210_143215");
}

TEST_CASE("capture_time_prefers_original_over_datetime") {
  TempDir dir("capture_exif");
  write_text(dir / "scan.tif", make_tiff("2023:01:05 08:00:00", "2024:02:10 14:32:15"));
  REQUIRE(ingest::base_name(ingest::capture_time(dir / "scan.tif")) == "image_240210_143215");
}

TEST_CASE("capture_time_falls_back_to_mtime") {
  TempDir dir("capture_mtime");
  const auto file = dir / "plain.tif";
  write_text(file, "no exif here");
  fs::last_write_time(file, fs::file_time_type::clock::now() - std::chrono::hours(24));

  const auto expected = SystemClock::now() - std::chrono::hours(24);
  const auto got = ingest::capture_time(file);
  const auto diff = std::chrono::duration_cast<std::chrono::seconds>(got - expected).count();
  REQUIRE(diff > -5);
  REQUIRE(diff < 5);
}

TEST_CASE("ingest_names_by_capture_time_and_counts_collisions") {
  TempDir inbox("ingest_in");
  TempDir archive("ingest_archive");
  ingest::IngestNamer namer(archive.path());

  const std::string tiff = make_tiff("2023:01:05 08:00:00", "2024:02:10 14:32:15");
  for (int i = 0; i < 3; ++i) {
    write_text(inbox / ("scan" + std::to_string(i) + ".tif"), tiff);
  }

  const auto first = namer.ingest(inbox / "scan0.tif");
  const auto second = namer.ingest(inbox / "scan1.tif");
  const auto third = namer.ingest(inbox / "scan2.tif");

  REQUIRE(first.filename() == "image_240210_143215.tif");
  REQUIRE(second.filename() == "image_240210_143215_01.tif");
  REQUIRE(third.filename() == "image_240210_143215_02.tif");
  REQUIRE(fs::exists(third));
  REQUIRE_FALSE(fs::exists(inbox / "scan0.tif"));
}

TEST_CASE("ingest_collision_is_by_stem_across_extensions") {
  TempDir inbox("stem_in");
  TempDir archive("stem_archive");
  write_text(archive / "image_240210_143215.jpg", "x");

  write_text(inbox / "scan.tif", make_tiff("2023:01:05 08:00:00", "2024:02:10 14:32:15"));
  ingest::IngestNamer namer(archive.path());
  REQUIRE(namer.ingest(inbox / "scan.tif").filename() == "image_240210_143215_01.tif");
}

TEST_CASE("ingest_missing_source_throws_and_leaves_archive_empty") {
  TempDir archive("ingest_missing");
  ingest::IngestNamer namer(archive.path());
  REQUIRE_THROWS_AS(namer.ingest(archive / "../does_not_exist.tif"), IOError);
}
