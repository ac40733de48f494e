#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace slide_ingest {

namespace fs = std::filesystem;

using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;

// Pending entry owned by a StabilityWatcher
struct WatchedFile {
    fs::path path;
    std::uintmax_t last_size = 0;
    SteadyClock::time_point last_change;
};

// Enhancement presets, evaluated in declaration order by auto-quality
struct EnhancementPreset {
    const char* name;
    float histogram_clip;  // percent per histogram tail
    float clahe_clip;      // CLAHE contrast limit
};

inline const std::array<EnhancementPreset, 3>& enhancement_presets() {
    static const std::array<EnhancementPreset, 3> kPresets{{
        {"gentle", 0.3f, 1.0f},
        {"balanced", 0.5f, 1.5f},
        {"aggressive", 0.7f, 2.0f},
    }};
    return kPresets;
}

inline std::optional<EnhancementPreset> find_preset(const std::string& name) {
    for (const auto& p : enhancement_presets()) {
        if (name == p.name) return p;
    }
    return std::nullopt;
}

struct EnhancementParams {
    float histogram_clip = 0.5f;
    float clahe_clip = 1.5f;
    std::optional<std::string> preset;  // set when chosen by auto-quality
};

struct EnhancementResult {
    cv::Mat enhanced;          // 8-bit BGR
    int original_width = 0;
    int original_height = 0;
    EnhancementParams params;
    bool faces_detected = false;
    int face_count = 0;
    float quality_score = 0.0f;  // [0, 100]
};

enum class OutputFormat {
    JPEG,
    PNG_ARCHIVE,
    TIFF16_ARCHIVE,
    JPEG_XL
};

inline std::string output_format_to_string(OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::JPEG: return "jpg";
        case OutputFormat::PNG_ARCHIVE: return "png";
        case OutputFormat::TIFF16_ARCHIVE: return "tiff";
        case OutputFormat::JPEG_XL: return "jxl";
        default: return "unknown";
    }
}

using SavedOutputs = std::map<OutputFormat, fs::path>;

// Duplicate detection
enum class DuplicateKind {
    EXACT,
    NEAR,
    SIMILAR
};

enum class DuplicateAction {
    SKIP,
    ALERT,
    NONE
};

inline std::string duplicate_kind_to_string(DuplicateKind kind) {
    switch (kind) {
        case DuplicateKind::EXACT: return "exact";
        case DuplicateKind::NEAR: return "near";
        case DuplicateKind::SIMILAR: return "similar";
        default: return "unknown";
    }
}

inline std::string duplicate_action_to_string(DuplicateAction action) {
    switch (action) {
        case DuplicateAction::SKIP: return "skip";
        case DuplicateAction::ALERT: return "alert";
        case DuplicateAction::NONE: return "none";
        default: return "unknown";
    }
}

struct DuplicateMatch {
    fs::path path;
    double similarity = 0.0;
};

struct DuplicateGroup {
    fs::path seed;
    std::vector<DuplicateMatch> matches;
    double mean_similarity = 0.0;
    DuplicateKind kind = DuplicateKind::SIMILAR;
    DuplicateAction action = DuplicateAction::NONE;
};

struct InboundDuplicate {
    fs::path input;
    fs::path match;
    double similarity = 0.0;
    DuplicateKind kind = DuplicateKind::NEAR;
    DuplicateAction action = DuplicateAction::ALERT;
};

struct InboundScanReport {
    std::vector<InboundDuplicate> records;
    int skip_count = 0;
    int alert_count = 0;
    int total_input = 0;
};

// Per-file processing state machine
enum class Stage {
    QUEUED,
    INGESTING,
    ENHANCING,
    SAVING,
    TAGGING,
    COMPLETE,
    ERROR
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::QUEUED: return "queued";
        case Stage::INGESTING: return "ingestion";
        case Stage::ENHANCING: return "enhancement";
        case Stage::SAVING: return "saving";
        case Stage::TAGGING: return "tagging";
        case Stage::COMPLETE: return "complete";
        case Stage::ERROR: return "error";
        default: return "unknown";
    }
}

inline float stage_progress(Stage stage) {
    switch (stage) {
        case Stage::QUEUED: return 0.0f;
        case Stage::INGESTING: return 10.0f;
        case Stage::ENHANCING: return 40.0f;
        case Stage::SAVING: return 70.0f;
        case Stage::TAGGING: return 90.0f;
        case Stage::COMPLETE: return 100.0f;
        default: return 0.0f;
    }
}

struct ErrorRecord {
    std::string filename;
    std::string message;
    std::string timestamp;  // ISO-8601 UTC
    std::string stage;
};

struct Tag {
    std::string label;
    float confidence = 0.0f;  // [0, 1]
    std::string category = "general";
};

struct Alert {
    std::string type;
    std::string severity;  // info | warning | error
    std::string message;
    std::string timestamp;
};

} // namespace slide_ingest
