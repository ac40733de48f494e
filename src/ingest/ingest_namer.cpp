#include "slide_ingest/ingest/ingest_namer.hpp"
#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/core/utils.hpp"
#include "slide_ingest/io/exif_reader.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace slide_ingest::ingest {

namespace {

SystemClock::time_point file_mtime(const fs::path& path) {
    std::error_code ec;
    const auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        throw IOError("Cannot stat " + path.string() + ": " + ec.message());
    }
    // file_clock and system_clock share an epoch offset only in C++20
    return SystemClock::now() +
           std::chrono::duration_cast<SystemClock::duration>(ftime - fs::file_time_type::clock::now());
}

std::string format_local(SystemClock::time_point time, const char* fmt) {
    const std::time_t t = SystemClock::to_time_t(time);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, fmt);
    return oss.str();
}

} // namespace

SystemClock::time_point capture_time(const fs::path& path) {
    io::ExifDateTimes exif;
    try {
        exif = io::read_exif_datetimes(path);
    } catch (const IOError& e) {
        core::log_line("INGEST", std::string("Could not read EXIF: ") + e.what());
    }

    for (const auto* value : {&exif.original, &exif.digitized, &exif.datetime}) {
        if (!*value) continue;
        if (auto tp = io::parse_exif_datetime(**value)) {
            core::log_line("INGEST", "Using EXIF date for " + path.filename().string() + ": " + **value);
            return *tp;
        }
    }

    const auto mtime = file_mtime(path);
    core::log_line("INGEST", "Using file date for " + path.filename().string() + ": " +
                                 format_local(mtime, "%Y-%m-%d %H:%M:%S"));
    return mtime;
}

std::string base_name(SystemClock::time_point time) {
    return "image_" + format_local(time, "%y%m%d_%H%M%S");
}

bool stem_taken(const fs::path& dir, const std::string& stem) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().stem().string() == stem) return true;
    }
    return false;
}

fs::path resolve_unique(const fs::path& dir, SystemClock::time_point time,
                        const std::string& extension) {
    const std::string base = base_name(time);
    std::string stem = base;
    for (int counter = 1; stem_taken(dir, stem); ++counter) {
        std::ostringstream oss;
        oss << base << '_' << std::setfill('0') << std::setw(2) << counter;
        stem = oss.str();
    }
    return dir / (stem + extension);
}

IngestNamer::IngestNamer(fs::path archive_dir)
    : archive_dir_(std::move(archive_dir)) {}

fs::path IngestNamer::ingest(const fs::path& source) {
    const auto when = capture_time(source);

    std::lock_guard<std::mutex> lock(mutex_);
    core::ensure_directory(archive_dir_);

    const fs::path destination = resolve_unique(archive_dir_, when, source.extension().string());
    core::move_file(source, destination);

    core::log_line("INGEST", "Renamed: " + source.filename().string() + " -> " +
                                 destination.filename().string());
    return destination;
}

} // namespace slide_ingest::ingest
