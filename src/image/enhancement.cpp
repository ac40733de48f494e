#include "slide_ingest/image/enhancement.hpp"
#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace slide_ingest::image {

namespace {

constexpr float kLowPercentile = 0.1f;
constexpr float kHighPercentile = 99.9f;
constexpr int kGridTileSide = 450;
constexpr float kFaceMargin = 0.3f;
constexpr int kFaceBlurKernel = 51;
constexpr double kTargetLumaStd = 55.0;

// numpy-style linear-interpolated percentile over a 16-bit histogram
float percentile_from_histogram(const std::vector<uint64_t>& hist, uint64_t total, float pct) {
    const double idx = static_cast<double>(pct) / 100.0 * static_cast<double>(total - 1);
    const uint64_t lower_rank = static_cast<uint64_t>(idx);
    const uint64_t upper_rank = std::min(lower_rank + 1, total - 1);
    const double frac = idx - static_cast<double>(lower_rank);

    double lower_value = 0.0;
    double upper_value = 0.0;
    bool have_lower = false;
    uint64_t cumulative = 0;
    for (size_t v = 0; v < hist.size(); ++v) {
        cumulative += hist[v];
        if (!have_lower && cumulative > lower_rank) {
            lower_value = static_cast<double>(v);
            have_lower = true;
        }
        if (cumulative > upper_rank) {
            upper_value = static_cast<double>(v);
            break;
        }
    }
    return static_cast<float>(lower_value * (1.0 - frac) + upper_value * frac);
}

std::pair<float, float> stretch_bounds(const cv::Mat& img) {
    const uint64_t total = static_cast<uint64_t>(img.total()) * static_cast<uint64_t>(img.channels());

    if (img.depth() == CV_16U) {
        std::vector<uint64_t> hist(65536, 0);
        const cv::Mat flat = img.isContinuous() ? img : img.clone();
        const auto* data = flat.ptr<uint16_t>();
        for (uint64_t i = 0; i < total; ++i) {
            ++hist[data[i]];
        }
        return {percentile_from_histogram(hist, total, kLowPercentile),
                percentile_from_histogram(hist, total, kHighPercentile)};
    }

    cv::Mat samples;
    img.reshape(1, 1).convertTo(samples, CV_32F);
    const Eigen::Map<const VectorXf> view(samples.ptr<float>(), static_cast<Eigen::Index>(samples.total()));
    const VectorXf values = view;
    return {core::compute_percentile(values, kLowPercentile),
            core::compute_percentile(values, kHighPercentile)};
}

// First index whose cumulative count reaches `value`
int search_sorted(const std::array<int64_t, 256>& cdf, int64_t value) {
    return static_cast<int>(std::lower_bound(cdf.begin(), cdf.end(), value) - cdf.begin());
}

} // namespace

EnhancementSettings EnhancementSettings::from_config(const config::EnhancementConfig& cfg) {
    EnhancementSettings s;
    s.histogram_clip = cfg.histogram_clip;
    s.clahe_clip = cfg.clahe_clip;
    s.adaptive_grid = cfg.adaptive_grid;
    s.face_detection = cfg.face_detection;
    return s;
}

SaveOptions SaveOptions::from_config(const config::OutputConfig& cfg) {
    SaveOptions o;
    o.jpeg_quality = cfg.jpeg_quality;
    o.png_archive = cfg.png_archive;
    o.tiff_archive = cfg.tiff_archive;
    o.jxl = cfg.jxl;
    return o;
}

cv::Mat normalize_bit_depth(const cv::Mat& img) {
    if (img.empty()) {
        throw DecodeError("empty image");
    }

    cv::Mat eight_bit;
    if (img.depth() == CV_8U) {
        eight_bit = img;
    } else {
        auto [lo, hi] = stretch_bounds(img);
        if (hi > lo) {
            const double alpha = 255.0 / (static_cast<double>(hi) - lo);
            img.convertTo(eight_bit, CV_8U, alpha, -alpha * lo);
        } else if (img.depth() == CV_16U) {
            img.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
        } else {
            img.convertTo(eight_bit, CV_8U);
        }
    }

    cv::Mat bgr;
    switch (eight_bit.channels()) {
        case 1:
            cv::cvtColor(eight_bit, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = eight_bit;
            break;
        case 4:
            cv::cvtColor(eight_bit, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw DecodeError("unsupported channel count: " + std::to_string(eight_bit.channels()));
    }
    return bgr;
}

cv::Mat auto_levels(const cv::Mat& img, float clip_percent) {
    cv::Mat gray;
    cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);

    std::array<int64_t, 256> cdf{};
    for (int y = 0; y < gray.rows; ++y) {
        const uint8_t* row = gray.ptr<uint8_t>(y);
        for (int x = 0; x < gray.cols; ++x) {
            ++cdf[row[x]];
        }
    }
    for (size_t i = 1; i < cdf.size(); ++i) {
        cdf[i] += cdf[i - 1];
    }

    const int64_t total = static_cast<int64_t>(gray.total());
    const int64_t clip_pixels = static_cast<int64_t>(static_cast<double>(total) * clip_percent / 100.0);

    const int min_gray = search_sorted(cdf, clip_pixels);
    const int max_gray = search_sorted(cdf, total - clip_pixels);
    if (max_gray <= min_gray) {
        return img.clone();
    }

    const double alpha = 255.0 / (max_gray - min_gray);
    cv::Mat out;
    img.convertTo(out, CV_8U, alpha, -alpha * min_gray);
    return out;
}

cv::Size clahe_grid_for(const cv::Size& image_size, bool adaptive) {
    if (!adaptive) return cv::Size(8, 8);
    const int cols = std::clamp(image_size.width / kGridTileSide, 4, 16);
    const int rows = std::clamp(image_size.height / kGridTileSide, 4, 16);
    return cv::Size(cols, rows);
}

cv::Mat apply_local_contrast(const cv::Mat& img, float clip_limit, const cv::Size& grid) {
    cv::Mat lab;
    cv::cvtColor(img, lab, cv::COLOR_BGR2Lab);

    std::vector<cv::Mat> channels;
    cv::split(lab, channels);

    auto clahe = cv::createCLAHE(clip_limit, grid);
    cv::Mat l_enhanced;
    clahe->apply(channels[0], l_enhanced);
    channels[0] = l_enhanced;

    cv::merge(channels, lab);
    cv::Mat out;
    cv::cvtColor(lab, out, cv::COLOR_Lab2BGR);
    return out;
}

cv::Mat face_mask(const cv::Size& size, const std::vector<cv::Rect>& faces) {
    cv::Mat mask = cv::Mat::zeros(size, CV_32F);

    for (const auto& f : faces) {
        const int margin = static_cast<int>(std::max(f.width, f.height) * kFaceMargin);
        const int x1 = std::max(0, f.x - margin);
        const int y1 = std::max(0, f.y - margin);
        const int x2 = std::min(size.width, f.x + f.width + margin);
        const int y2 = std::min(size.height, f.y + f.height + margin);
        if (x2 <= x1 || y2 <= y1) continue;

        const cv::Point center((x1 + x2) / 2, (y1 + y2) / 2);
        const cv::Size axes((x2 - x1) / 2, (y2 - y1) / 2);
        cv::ellipse(mask, center, axes, 0.0, 0.0, 360.0, cv::Scalar(1.0), cv::FILLED);
    }

    cv::GaussianBlur(mask, mask, cv::Size(kFaceBlurKernel, kFaceBlurKernel), 0.0);
    return mask;
}

cv::Mat blend_with_mask(const cv::Mat& inside, const cv::Mat& outside, const cv::Mat& mask) {
    cv::Mat in_f, out_f;
    inside.convertTo(in_f, CV_32F);
    outside.convertTo(out_f, CV_32F);

    cv::Mat mask3;
    cv::merge(std::vector<cv::Mat>(static_cast<size_t>(inside.channels()), mask), mask3);

    cv::Mat inv;
    cv::subtract(cv::Scalar::all(1.0), mask3, inv);

    cv::Mat blended = in_f.mul(mask3) + out_f.mul(inv);
    cv::Mat result;
    blended.convertTo(result, CV_8U);
    return result;
}

QualityBreakdown quality_components(const cv::Mat& img) {
    cv::Mat gray;
    if (img.channels() == 1) {
        gray = img;
    } else {
        cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    }

    QualityBreakdown q;

    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F);
    cv::Scalar lap_mean, lap_std;
    cv::meanStdDev(lap, lap_mean, lap_std);
    const double variance = lap_std[0] * lap_std[0];
    q.sharpness = static_cast<float>(std::min(100.0, variance / 100.0));

    cv::Scalar mean, std_dev;
    cv::meanStdDev(gray, mean, std_dev);
    const double contrast = 100.0 * (1.0 - std::abs(std_dev[0] - kTargetLumaStd) / kTargetLumaStd);
    q.contrast = static_cast<float>(std::clamp(contrast, 0.0, 100.0));

    double min_val = 0.0, max_val = 0.0;
    cv::minMaxLoc(gray, &min_val, &max_val);
    q.range = static_cast<float>((max_val - min_val) / 255.0 * 100.0);

    q.total = 0.4f * q.sharpness + 0.3f * q.contrast + 0.3f * q.range;
    q.total = std::clamp(q.total, 0.0f, 100.0f);
    return q;
}

float quality_score(const cv::Mat& img) {
    return quality_components(img).total;
}

EnhancementEngine::EnhancementEngine(EnhancementSettings settings, const std::string& face_cascade)
    : settings_(settings),
      faces_(settings.face_detection ? face_cascade : std::string()) {}

cv::Mat EnhancementEngine::load(const fs::path& path) {
    cv::Mat raw;
    try {
        raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError("Could not load image " + path.string() + ": " + e.what());
    }
    if (raw.empty()) {
        throw DecodeError("Could not load image: " + path.string());
    }
    return normalize_bit_depth(raw);
}

EnhancementResult EnhancementEngine::run(const cv::Mat& img, float histogram_clip, float clahe_clip) {
    EnhancementResult result;
    result.original_width = img.cols;
    result.original_height = img.rows;
    result.params.histogram_clip = histogram_clip;
    result.params.clahe_clip = clahe_clip;

    const cv::Size grid = clahe_grid_for(img.size(), settings_.adaptive_grid);

    cv::Mat leveled = auto_levels(img, histogram_clip);
    cv::Mat enhanced = apply_local_contrast(leveled, clahe_clip, grid);

    if (settings_.face_detection && faces_.available()) {
        const auto faces = faces_.detect(enhanced);
        if (!faces.empty()) {
            cv::Mat gentle = apply_local_contrast(enhanced, clahe_clip * 0.5f, grid);
            enhanced = blend_with_mask(gentle, enhanced, face_mask(enhanced.size(), faces));
            result.faces_detected = true;
            result.face_count = static_cast<int>(faces.size());
        }
    }

    result.quality_score = quality_score(enhanced);
    result.enhanced = enhanced;
    return result;
}

EnhancementResult EnhancementEngine::enhance(const cv::Mat& img) {
    return run(img, settings_.histogram_clip, settings_.clahe_clip);
}

EnhancementResult EnhancementEngine::enhance(const cv::Mat& img, const EnhancementPreset& preset) {
    EnhancementResult result = run(img, preset.histogram_clip, preset.clahe_clip);
    result.params.preset = preset.name;
    return result;
}

EnhancementResult EnhancementEngine::enhance_auto(const cv::Mat& img) {
    EnhancementResult best;
    bool have_best = false;

    for (const auto& preset : enhancement_presets()) {
        EnhancementResult candidate = enhance(img, preset);
        if (!have_best || candidate.quality_score > best.quality_score) {
            best = std::move(candidate);
            have_best = true;
        }
    }

    core::log_line("ENHANCE", "Auto-quality picked " + *best.params.preset +
                                  " (score " + std::to_string(best.quality_score) + ")");
    return best;
}

EnhancementResult EnhancementEngine::process(const fs::path& path, bool auto_quality) {
    const cv::Mat img = load(path);
    return auto_quality ? enhance_auto(img) : enhance(img);
}

SavedOutputs EnhancementEngine::save(const EnhancementResult& result, const fs::path& output_stem,
                                     const SaveOptions& options) const {
    if (result.enhanced.empty()) {
        throw IOError("nothing to save for " + output_stem.string());
    }
    if (output_stem.has_parent_path()) {
        core::ensure_directory(output_stem.parent_path());
    }

    SavedOutputs saved;
    const std::string stem = output_stem.string();

    const fs::path jpg = stem + ".jpg";
    bool ok = false;
    try {
        ok = cv::imwrite(jpg.string(), result.enhanced,
                         {cv::IMWRITE_JPEG_QUALITY, options.jpeg_quality});
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write " + jpg.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write " + jpg.string());
    }
    saved[OutputFormat::JPEG] = jpg;

    auto write_optional = [&](OutputFormat fmt, const fs::path& path, const cv::Mat& data) {
        if (!cv::haveImageWriter(path.string())) {
            core::log_line("ENHANCE", "No encoder for " + output_format_to_string(fmt) + ", skipped");
            return;
        }
        try {
            if (cv::imwrite(path.string(), data)) {
                saved[fmt] = path;
                return;
            }
            core::log_line("ENHANCE", "Encoder refused " + path.string() + ", skipped");
        } catch (const cv::Exception& e) {
            core::log_line("ENHANCE", "Cannot write " + path.string() + ": " + e.what());
        }
    };

    if (options.png_archive) {
        write_optional(OutputFormat::PNG_ARCHIVE, stem + "_archive.png", result.enhanced);
    }
    if (options.tiff_archive) {
        cv::Mat sixteen;
        result.enhanced.convertTo(sixteen, CV_16U, 257.0);
        write_optional(OutputFormat::TIFF16_ARCHIVE, stem + "_16bit.tif", sixteen);
    }
    if (options.jxl) {
        write_optional(OutputFormat::JPEG_XL, stem + ".jxl", result.enhanced);
    }

    return saved;
}

} // namespace slide_ingest::image
