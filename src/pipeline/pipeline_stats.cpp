#include "slide_ingest/pipeline/pipeline_stats.hpp"
#include "slide_ingest/core/json_io.hpp"
#include "slide_ingest/core/utils.hpp"

#include <cmath>

namespace slide_ingest::pipeline {

namespace {

double round_to(double v, int digits) {
    const double f = std::pow(10.0, digits);
    return std::round(v * f) / f;
}

} // namespace

void to_json(nlohmann::json& j, const CurrentOperation& c) {
    j = nlohmann::json{
        {"is_processing", c.processing},
        {"current_file", c.file.empty() ? nlohmann::json(nullptr) : nlohmann::json(c.file)},
        {"current_stage", c.stage.empty() ? nlohmann::json(nullptr) : nlohmann::json(c.stage)},
        {"progress", c.progress}
    };
}

void to_json(nlohmann::json& j, const TimelineBucket& b) {
    j = nlohmann::json{{"hour", b.hour}, {"timestamp", b.timestamp}, {"count", b.count}};
}

void to_json(nlohmann::json& j, const TelemetrySnapshot& s) {
    j = nlohmann::json{
        {"current", s.current},
        {"pipeline", {
            {"pending", s.pending},
            {"completed_session", s.processed}
        }},
        {"performance", {
            {"pictures_per_hour", round_to(s.throughput_per_hour, 1)},
            {"avg_time_per_image", round_to(s.avg_seconds, 1)},
            {"eta_minutes", static_cast<int>(s.eta_seconds / 60.0)},
            {"processing_trend", s.trend}
        }},
        {"history", {
            {"session_duration_hours", round_to(s.session_hours, 2)},
            {"error_count", s.errors},
            {"hourly_timeline", s.timeline},
            {"error_log", s.error_log}
        }},
        {"alerts", s.alerts}
    };
}

std::string compute_trend(const std::deque<double>& durations) {
    if (durations.size() < kTrendMinSamples) return "stable";

    const std::vector<double> all(durations.begin(), durations.end());
    const std::vector<double> recent(durations.end() - kTrendRecentSamples, durations.end());
    const double overall = core::mean_of(all);
    const double recent_avg = core::mean_of(recent);

    if (recent_avg > overall * 1.3) return "degrading";
    if (recent_avg < overall * 0.7) return "accelerating";
    return "stable";
}

PipelineStats::PipelineStats(bool stall_alert, SystemClock::time_point started)
    : stall_alert_(stall_alert), started_(started) {}

void PipelineStats::record_success(double seconds, SystemClock::time_point at) {
    const std::int64_t hour = core::hours_since_epoch(at);

    std::lock_guard<std::mutex> lock(mutex_);
    ++processed_;
    durations_.push_back(seconds);
    while (durations_.size() > kDurationWindow) {
        durations_.pop_front();
    }

    HourSlot& slot = hours_[static_cast<size_t>(hour % kTimelineHours)];
    if (slot.hour != hour) {
        slot.hour = hour;
        slot.count = 0;
    }
    ++slot.count;
}

void PipelineStats::record_failure(const std::string& filename, const std::string& message,
                                   const std::string& stage, SystemClock::time_point at) {
    ErrorRecord rec{filename, message, core::format_iso_utc(at), stage.empty() ? "unknown" : stage};

    std::lock_guard<std::mutex> lock(mutex_);
    ++errors_;
    error_log_.push_back(std::move(rec));
    while (error_log_.size() > kErrorLogCapacity) {
        error_log_.pop_front();
    }
}

void PipelineStats::set_cursor(const std::string& file, Stage stage) {
    set_cursor(file, stage_to_string(stage), stage_progress(stage));
}

void PipelineStats::set_cursor(const std::string& file, const std::string& stage, float progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.processing = true;
    current_.file = file;
    current_.stage = stage;
    current_.progress = progress;
}

void PipelineStats::clear_cursor() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = CurrentOperation{};
}

int PipelineStats::processed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_;
}

int PipelineStats::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

std::deque<double> PipelineStats::durations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durations_;
}

std::vector<ErrorRecord> PipelineStats::error_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {error_log_.begin(), error_log_.end()};
}

CurrentOperation PipelineStats::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

TelemetrySnapshot PipelineStats::snapshot(int pending_count, SystemClock::time_point now) const {
    TelemetrySnapshot s;
    std::deque<double> durations;
    std::array<HourSlot, kTimelineHours> hours;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.current = current_;
        s.processed = processed_;
        s.errors = errors_;
        s.error_log.assign(error_log_.begin(), error_log_.end());
        durations = durations_;
        hours = hours_;
    }

    s.pending = pending_count;
    if (!durations.empty()) {
        s.avg_seconds = core::mean_of(std::vector<double>(durations.begin(), durations.end()));
    }
    if (s.avg_seconds > 0.0) {
        s.throughput_per_hour = 3600.0 / s.avg_seconds;
        s.eta_seconds = pending_count * s.avg_seconds;
    }
    s.trend = compute_trend(durations);
    s.session_hours = std::chrono::duration<double>(now - started_).count() / 3600.0;

    const std::int64_t now_hour = core::hours_since_epoch(now);
    s.timeline.reserve(kTimelineHours);
    for (int i = 0; i < kTimelineHours; ++i) {
        const std::int64_t hour = now_hour - (kTimelineHours - 1) + i;
        const HourSlot& slot = hours[static_cast<size_t>(hour % kTimelineHours)];
        const SystemClock::time_point tp{std::chrono::hours(hour)};

        TimelineBucket bucket;
        bucket.hour = core::format_utc(tp, "%H:00");
        bucket.timestamp = core::format_utc(tp, "%Y-%m-%d %H:00");
        bucket.count = slot.hour == hour ? slot.count : 0;
        s.timeline.push_back(std::move(bucket));
    }

    s.alerts = compute_alerts(s, core::format_iso_utc(now));
    return s;
}

std::vector<Alert> PipelineStats::compute_alerts(const TelemetrySnapshot& s, const std::string& ts) const {
    std::vector<Alert> alerts;

    // idle with backlog, after at least one completed file
    if (stall_alert_ && s.processed > 0 && !s.current.processing && s.pending > 0) {
        alerts.push_back({"stall_warning", "warning",
                          "Pipeline idle with " + std::to_string(s.pending) + " pending files", ts});
    }

    if (s.trend == "degrading") {
        alerts.push_back({"performance_degradation", "info", "Processing speed has slowed down", ts});
    }

    if (s.errors > 0) {
        const int attempts = s.processed + s.errors;
        const double rate = static_cast<double>(s.errors) / attempts;
        if (rate > 0.1) {
            alerts.push_back({"high_error_rate", "error",
                              "High error rate: " + std::to_string(s.errors) + " errors out of " +
                                  std::to_string(attempts) + " files (" +
                                  std::to_string(static_cast<int>(rate * 100)) + "%)",
                              ts});
        }
        if (s.processed == 0) {
            alerts.push_back({"all_errors", "error",
                              std::to_string(s.errors) +
                                  " file(s) failed with errors. Check the error log.",
                              ts});
        }
    }
    return alerts;
}

} // namespace slide_ingest::pipeline
