#pragma once

#include "slide_ingest/core/types.hpp"
#include "slide_ingest/core/worker_pool.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace slide_ingest::dedup {

// 16x16 low-frequency block -> 256 bits -> 64 hex characters
constexpr int kHashSize = 16;
constexpr int kHashSampleSide = kHashSize * 4;
constexpr double kExactSimilarity = 0.99;

// DCT perceptual hash of an 8-bit gray or BGR image.
std::string compute_hash(const cv::Mat& img);

// Empty string when the file cannot be decoded.
std::string compute_hash(const fs::path& path);

// 1 - hamming / bits in [0,1]; 0 when either hash is empty or malformed.
double similarity(const std::string& a, const std::string& b);

/**
 * Perceptual-hash duplicate finder with a path-keyed hash cache. Each entry
 * remembers the file size and mtime it was computed from; a file replaced
 * under the same name is hashed again.
 *
 * Grouping is representative based: images are visited in the given order
 * and each not yet grouped image collects every later, not yet grouped image
 * at or above the threshold. Two images that are each close to a third but
 * not to each other therefore land in one group only when the third one is
 * visited first.
 *
 * The cache takes concurrent readers; misses are computed on the worker pool
 * when one is supplied.
 */
class DuplicateDetector {
public:
    explicit DuplicateDetector(double threshold = 0.95, core::WorkerPool* pool = nullptr);

    double threshold() const { return threshold_; }

    std::string hash_for(const fs::path& path);

    std::vector<DuplicateGroup> find_groups(const std::vector<fs::path>& paths);
    std::vector<DuplicateGroup> find_groups_in(const fs::path& directory);

    // First archived match for one inbound file: >= 0.99 is exact/skip,
    // >= threshold is near/alert. Scanning stops at the first qualifying match.
    std::optional<InboundDuplicate> match_inbound(const fs::path& input,
                                                  const std::vector<fs::path>& archived);

    InboundScanReport scan_inbound(const std::vector<fs::path>& inputs,
                                   const std::vector<fs::path>& archived);
    InboundScanReport scan_inbound(const fs::path& input_dir, const fs::path& archive_dir);

    size_t cache_size() const;
    void clear_cache();
    // Drops one path, e.g. an inbound file that is about to be moved away.
    void evict(const fs::path& path);

private:
    struct CacheEntry {
        std::uintmax_t size = 0;
        fs::file_time_type mtime;
        std::string hash;
    };

    std::vector<std::string> hash_all(const std::vector<fs::path>& paths);
    DuplicateKind classify(double similarity) const;

    double threshold_;
    core::WorkerPool* pool_;

    std::map<std::string, CacheEntry> cache_;
    mutable std::shared_mutex cache_mutex_;
};

} // namespace slide_ingest::dedup
