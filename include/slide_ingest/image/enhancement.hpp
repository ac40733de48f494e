#pragma once

#include "slide_ingest/core/types.hpp"
#include "slide_ingest/config/configuration.hpp"
#include "slide_ingest/image/face_detector.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace slide_ingest::image {

struct EnhancementSettings {
    float histogram_clip = 0.5f;
    float clahe_clip = 1.5f;
    bool adaptive_grid = true;
    bool face_detection = true;

    static EnhancementSettings from_config(const config::EnhancementConfig& cfg);
};

struct SaveOptions {
    int jpeg_quality = 95;
    bool png_archive = false;
    bool tiff_archive = false;
    bool jxl = false;

    static SaveOptions from_config(const config::OutputConfig& cfg);
};

struct QualityBreakdown {
    float sharpness = 0.0f;  // min(100, var(Laplacian) / 100)
    float contrast = 0.0f;   // peaks at a luma std of 55
    float range = 0.0f;      // (max - min) luma scaled to 0..100
    float total = 0.0f;      // 0.4 / 0.3 / 0.3 weighted
};

// 16-bit and float input: 0.1/99.9 percentile stretch to 8-bit.
// Gray and BGRA become BGR. Output is always CV_8UC3.
cv::Mat normalize_bit_depth(const cv::Mat& img);

// Black/white points from the luma CDF, `clip_percent` clipped per tail.
// Returns the input unchanged when the points are degenerate.
cv::Mat auto_levels(const cv::Mat& img, float clip_percent);

// Tiles as cv::Size(columns, rows): clamp(side / 450, 4, 16), or 8x8.
cv::Size clahe_grid_for(const cv::Size& image_size, bool adaptive);

// CLAHE on the L channel of Lab, chroma untouched.
cv::Mat apply_local_contrast(const cv::Mat& img, float clip_limit, const cv::Size& grid);

// CV_32F mask in [0,1]: a filled ellipse per face (30% margin), 51x51 blur.
cv::Mat face_mask(const cv::Size& size, const std::vector<cv::Rect>& faces);

// inside * mask + outside * (1 - mask)
cv::Mat blend_with_mask(const cv::Mat& inside, const cv::Mat& outside, const cv::Mat& mask);

QualityBreakdown quality_components(const cv::Mat& img);
float quality_score(const cv::Mat& img);

/**
 * Film scan enhancement: auto-levels, Lab CLAHE and optional face-aware
 * softening, with an auto-quality mode that tries every preset and keeps the
 * best scoring output.
 *
 * The face cascade is loaded once in the constructor; a missing cascade only
 * disables the softening step.
 */
class EnhancementEngine {
public:
    explicit EnhancementEngine(EnhancementSettings settings = {},
                               const std::string& face_cascade = "");

    EnhancementEngine(const EnhancementEngine&) = delete;
    EnhancementEngine& operator=(const EnhancementEngine&) = delete;

    const EnhancementSettings& settings() const { return settings_; }
    bool face_detection_available() const { return faces_.available(); }

    // IMREAD_UNCHANGED + normalize_bit_depth. Throws DecodeError.
    static cv::Mat load(const fs::path& path);

    EnhancementResult enhance(const cv::Mat& img);
    EnhancementResult enhance(const cv::Mat& img, const EnhancementPreset& preset);

    // Presets in declaration order; a later preset must score strictly
    // higher to replace an earlier one.
    EnhancementResult enhance_auto(const cv::Mat& img);

    EnhancementResult process(const fs::path& path, bool auto_quality);

    // Writes <stem>.jpg plus the requested archival formats. A failed JPEG
    // throws IOError; optional formats are skipped when they cannot be written.
    SavedOutputs save(const EnhancementResult& result, const fs::path& output_stem,
                      const SaveOptions& options) const;

private:
    EnhancementResult run(const cv::Mat& img, float histogram_clip, float clahe_clip);

    EnhancementSettings settings_;
    FaceDetector faces_;
};

} // namespace slide_ingest::image
