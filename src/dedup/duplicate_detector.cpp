#include "slide_ingest/dedup/duplicate_detector.hpp"
#include "slide_ingest/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <future>
#include <mutex>
#include <set>
#include <system_error>

namespace slide_ingest::dedup {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

DuplicateAction action_for(DuplicateKind kind) {
    switch (kind) {
        case DuplicateKind::EXACT: return DuplicateAction::SKIP;
        case DuplicateKind::NEAR: return DuplicateAction::ALERT;
        default: return DuplicateAction::NONE;
    }
}

} // namespace

std::string compute_hash(const cv::Mat& img) {
    if (img.empty()) return "";

    cv::Mat gray;
    if (img.channels() == 1) {
        gray = img;
    } else if (img.channels() == 4) {
        cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    }

    cv::Mat small;
    cv::resize(gray, small, cv::Size(kHashSampleSide, kHashSampleSide), 0, 0, cv::INTER_AREA);

    cv::Mat samples;
    small.convertTo(samples, CV_32F);
    cv::Mat freq;
    cv::dct(samples, freq);

    const cv::Mat low = freq(cv::Rect(0, 0, kHashSize, kHashSize)).clone();
    std::vector<float> values(low.begin<float>(), low.end<float>());
    std::vector<float> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    const size_t mid = sorted.size() / 2;
    const float median = (sorted[mid - 1] + sorted[mid]) / 2.0f;

    static const char* kHex = "0123456789abcdef";
    std::string hash;
    hash.reserve(values.size() / 4);
    for (size_t i = 0; i < values.size(); i += 4) {
        int nibble = 0;
        for (size_t b = 0; b < 4; ++b) {
            nibble = (nibble << 1) | (values[i + b] > median ? 1 : 0);
        }
        hash.push_back(kHex[nibble]);
    }
    return hash;
}

std::string compute_hash(const fs::path& path) {
    try {
        cv::Mat img = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
        if (img.empty()) {
            core::log_line("DEDUP", "Error computing hash for " + path.string() + ": cannot decode");
            return "";
        }
        return compute_hash(img);
    } catch (const cv::Exception& e) {
        core::log_line("DEDUP", "Error computing hash for " + path.string() + ": " + e.what());
        return "";
    }
}

double similarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    int distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        const int x = hex_value(a[i]);
        const int y = hex_value(b[i]);
        if (x < 0 || y < 0) return 0.0;
        int diff = x ^ y;
        while (diff) {
            distance += diff & 1;
            diff >>= 1;
        }
    }

    const double bits = static_cast<double>(a.size() * 4);
    return std::clamp(1.0 - distance / bits, 0.0, 1.0);
}

DuplicateDetector::DuplicateDetector(double threshold, core::WorkerPool* pool)
    : threshold_(threshold), pool_(pool) {}

std::string DuplicateDetector::hash_for(const fs::path& path) {
    const std::string key = path.string();

    std::error_code ec;
    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        evict(path);
        return compute_hash(path);
    }
    const fs::file_time_type mtime = fs::last_write_time(path, ec);
    if (ec) {
        evict(path);
        return compute_hash(path);
    }

    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end() && it->second.size == size && it->second.mtime == mtime) {
            return it->second.hash;
        }
    }

    std::string hash = compute_hash(path);

    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    cache_[key] = CacheEntry{size, mtime, hash};
    return hash;
}

std::vector<std::string> DuplicateDetector::hash_all(const std::vector<fs::path>& paths) {
    std::vector<std::string> hashes(paths.size());
    if (pool_ == nullptr) {
        for (size_t i = 0; i < paths.size(); ++i) {
            hashes[i] = hash_for(paths[i]);
        }
        return hashes;
    }

    std::vector<std::future<std::string>> pending;
    pending.reserve(paths.size());
    for (const auto& p : paths) {
        pending.push_back(pool_->submit([this, p]() { return hash_for(p); }));
    }
    for (size_t i = 0; i < pending.size(); ++i) {
        hashes[i] = pending[i].get();
    }
    return hashes;
}

DuplicateKind DuplicateDetector::classify(double sim) const {
    if (sim >= kExactSimilarity) return DuplicateKind::EXACT;
    if (sim >= threshold_) return DuplicateKind::NEAR;
    return DuplicateKind::SIMILAR;
}

std::vector<DuplicateGroup> DuplicateDetector::find_groups(const std::vector<fs::path>& paths) {
    // each image at most once, first occurrence wins
    std::vector<fs::path> unique;
    std::set<fs::path> seen;
    for (const auto& p : paths) {
        if (seen.insert(p).second) unique.push_back(p);
    }

    std::vector<DuplicateGroup> groups;
    if (unique.size() < 2) return groups;

    core::log_line("DEDUP", "Computing hashes for " + std::to_string(unique.size()) + " images...");
    const std::vector<std::string> hashes = hash_all(unique);

    std::vector<bool> consumed(unique.size(), false);
    for (size_t i = 0; i < unique.size(); ++i) {
        if (consumed[i] || hashes[i].empty()) continue;

        DuplicateGroup group;
        group.seed = unique[i];
        for (size_t j = 0; j < unique.size(); ++j) {
            if (j == i || consumed[j] || hashes[j].empty()) continue;
            const double sim = similarity(hashes[i], hashes[j]);
            if (sim >= threshold_) {
                group.matches.push_back({unique[j], sim});
                consumed[j] = true;
            }
        }

        if (group.matches.empty()) continue;
        consumed[i] = true;

        double sum = 0.0;
        for (const auto& m : group.matches) sum += m.similarity;
        group.mean_similarity = sum / static_cast<double>(group.matches.size());
        group.kind = classify(group.mean_similarity);
        group.action = action_for(group.kind);
        groups.push_back(std::move(group));
    }

    core::log_line("DEDUP", "Found " + std::to_string(groups.size()) + " duplicate groups");
    return groups;
}

std::vector<DuplicateGroup> DuplicateDetector::find_groups_in(const fs::path& directory) {
    core::log_line("DEDUP", "Scanning for duplicates in: " + directory.string());
    return find_groups(core::discover_images(directory, true));
}

std::optional<InboundDuplicate> DuplicateDetector::match_inbound(const fs::path& input,
                                                                 const std::vector<fs::path>& archived) {
    const std::string input_hash = hash_for(input);
    if (input_hash.empty()) return std::nullopt;

    for (const auto& other : archived) {
        if (other == input) continue;
        const double sim = similarity(input_hash, hash_for(other));
        if (sim < threshold_ && sim < kExactSimilarity) continue;

        InboundDuplicate d;
        d.input = input;
        d.match = other;
        d.similarity = sim;
        d.kind = sim >= kExactSimilarity ? DuplicateKind::EXACT : DuplicateKind::NEAR;
        d.action = action_for(d.kind);
        return d;
    }
    return std::nullopt;
}

InboundScanReport DuplicateDetector::scan_inbound(const std::vector<fs::path>& inputs,
                                                  const std::vector<fs::path>& archived) {
    InboundScanReport report;
    report.total_input = static_cast<int>(inputs.size());

    // warm the cache in parallel; the matching pass below is cache-only
    std::vector<fs::path> all = inputs;
    all.insert(all.end(), archived.begin(), archived.end());
    hash_all(all);

    for (const auto& input : inputs) {
        auto match = match_inbound(input, archived);
        if (!match) continue;
        if (match->action == DuplicateAction::SKIP) {
            ++report.skip_count;
        } else {
            ++report.alert_count;
        }
        report.records.push_back(std::move(*match));
    }
    return report;
}

InboundScanReport DuplicateDetector::scan_inbound(const fs::path& input_dir, const fs::path& archive_dir) {
    core::log_line("DEDUP", "Scanning input for duplicates (pre-enhancement)...");
    return scan_inbound(core::discover_images(input_dir, true), core::discover_images(archive_dir, true));
}

size_t DuplicateDetector::cache_size() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return cache_.size();
}

void DuplicateDetector::clear_cache() {
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    cache_.clear();
}

void DuplicateDetector::evict(const fs::path& path) {
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    cache_.erase(path.string());
}

} // namespace slide_ingest::dedup
