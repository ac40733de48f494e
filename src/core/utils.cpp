#include "slide_ingest/core/utils.hpp"
#include "slide_ingest/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <system_error>

namespace slide_ingest::core {

std::string format_iso_utc(SystemClock::time_point tp) {
    auto time_t_now = SystemClock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string format_utc(SystemClock::time_point tp, const char* fmt) {
    auto t = SystemClock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, fmt);
    return oss.str();
}

std::string get_iso_timestamp() {
    return format_iso_utc(SystemClock::now());
}

std::string get_run_id() {
    auto now = SystemClock::now();
    auto time_t_now = SystemClock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::int64_t hours_since_epoch(SystemClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::hours>(tp.time_since_epoch()).count();
}

void log_line(const std::string& tag, const std::string& message) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << "[" << tag << "] " << message << std::endl;
}

bool is_supported_image(const fs::path& path) {
    const std::string ext = to_lower(path.extension().string());
    return ext == ".tif" || ext == ".tiff" || ext == ".jpg" || ext == ".jpeg";
}

bool is_tiff(const fs::path& path) {
    const std::string ext = to_lower(path.extension().string());
    return ext == ".tif" || ext == ".tiff";
}

std::vector<fs::path> discover_images(const fs::path& dir, bool recursive) {
    std::vector<fs::path> images;

    std::error_code ec;
    if (!fs::exists(dir, ec) || !fs::is_directory(dir, ec)) {
        return images;
    }

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(
                 dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && is_supported_image(it->path())) {
                images.push_back(it->path());
            }
        }
    } else {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (entry.is_regular_file(ec) && is_supported_image(entry.path())) {
                images.push_back(entry.path());
            }
        }
    }

    std::sort(images.begin(), images.end());
    return images;
}

std::vector<fs::path> discover_tiffs(const fs::path& dir) {
    std::vector<fs::path> images = discover_images(dir, true);
    images.erase(std::remove_if(images.begin(), images.end(),
                                [](const fs::path& p) { return !is_tiff(p); }),
                 images.end());
    return images;
}

void move_file(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) return;

    if (ec != std::errc::cross_device_link) {
        throw IOError("Cannot move " + src.string() + " -> " + dst.string() + ": " + ec.message());
    }

    // Different file systems: copy, then delete the source
    fs::copy_file(src, dst, fs::copy_options::none, ec);
    if (ec) {
        throw IOError("Cannot copy " + src.string() + " -> " + dst.string() + ": " + ec.message());
    }
    fs::remove(src, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(dst, cleanup_ec);
        throw IOError("Cannot remove source " + src.string() + ": " + ec.message());
    }
}

void ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw TransientIOError("Cannot create directory " + dir.string() + ": " + ec.message());
    }
}

float compute_percentile(const VectorXf& data, float percentile) {
    if (data.size() == 0) return 0.0f;

    std::vector<float> sorted(data.data(), data.data() + data.size());
    std::sort(sorted.begin(), sorted.end());

    float idx = percentile / 100.0f * static_cast<float>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(idx);
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    float frac = idx - static_cast<float>(lower);

    return sorted[lower] * (1.0f - frac) + sorted[upper] * frac;
}

double mean_of(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return Eigen::Map<const VectorXd>(values.data(),
                                      static_cast<Eigen::Index>(values.size())).mean();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}


} // namespace slide_ingest::core
