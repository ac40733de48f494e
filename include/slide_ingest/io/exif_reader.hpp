#pragma once

#include "slide_ingest/core/types.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace slide_ingest::io {

// Raw ASCII values ("YYYY:MM:DD HH:MM:SS") of the three EXIF date tags.
struct ExifDateTimes {
    std::optional<std::string> original;   // 0x9003 DateTimeOriginal
    std::optional<std::string> digitized;  // 0x9004 DateTimeDigitized
    std::optional<std::string> datetime;   // 0x0132 DateTime

    bool empty() const { return !original && !digitized && !datetime; }
};

/**
 * Reads the date tags from a TIFF file (IFD0 + Exif sub-IFD) or from the
 * APP1 "Exif" segment of a JPEG. Malformed or missing metadata yields an
 * empty result; only an unopenable file throws (IOError).
 */
ExifDateTimes read_exif_datetimes(const fs::path& path);

// Parses a TIFF structure starting at the current position of `in`.
ExifDateTimes parse_tiff_datetimes(std::istream& in);

// Parses "YYYY:MM:DD HH:MM:SS" (local time). Returns nullopt on any mismatch.
std::optional<SystemClock::time_point> parse_exif_datetime(const std::string& value);

} // namespace slide_ingest::io
