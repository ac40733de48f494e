#pragma once

#include "slide_ingest/core/types.hpp"
#include <mutex>
#include <string>

namespace slide_ingest::ingest {

// Capture time: first parsable EXIF date (Original, Digitized, DateTime),
// else the file's modification time.
SystemClock::time_point capture_time(const fs::path& path);

// "image_YYMMDD_HHMMSS" in local time
std::string base_name(SystemClock::time_point time);

// True if any entry in `dir` has the given stem, whatever its extension.
bool stem_taken(const fs::path& dir, const std::string& stem);

// <base><ext>, else <base>_01<ext>, <base>_02<ext>, ... first free stem.
fs::path resolve_unique(const fs::path& dir, SystemClock::time_point time,
                        const std::string& extension);

/**
 * Relocates raw scans into the archive under collision-free canonical names.
 * Resolution and the move happen under one lock so two ingests in the same
 * process can never pick the same name.
 */
class IngestNamer {
public:
    explicit IngestNamer(fs::path archive_dir);

    const fs::path& archive_dir() const { return archive_dir_; }

    // Moves `source` into the archive and returns the new path.
    // Throws IOError when the move fails; the source is left untouched then.
    fs::path ingest(const fs::path& source);

private:
    fs::path archive_dir_;
    std::mutex mutex_;
};

} // namespace slide_ingest::ingest
