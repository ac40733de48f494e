#pragma once

#include "slide_ingest/core/types.hpp"

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace slide_ingest::pipeline {

constexpr size_t kDurationWindow = 50;
constexpr size_t kErrorLogCapacity = 50;
constexpr int kTimelineHours = 48;
constexpr size_t kTrendMinSamples = 10;
constexpr size_t kTrendRecentSamples = 5;

struct CurrentOperation {
    bool processing = false;
    std::string file;
    std::string stage;
    float progress = 0.0f;
};

struct TimelineBucket {
    std::string hour;       // "HH:00"
    std::string timestamp;  // "YYYY-MM-DD HH:00" (UTC)
    int count = 0;
};

struct TelemetrySnapshot {
    CurrentOperation current;
    int processed = 0;
    int errors = 0;
    int pending = 0;
    double avg_seconds = 0.0;
    double throughput_per_hour = 0.0;
    double eta_seconds = 0.0;
    std::string trend = "stable";
    double session_hours = 0.0;
    std::vector<TimelineBucket> timeline;  // oldest first, kTimelineHours entries
    std::vector<ErrorRecord> error_log;    // oldest first
    std::vector<Alert> alerts;
};

void to_json(nlohmann::json& j, const CurrentOperation& c);
void to_json(nlohmann::json& j, const TimelineBucket& b);
void to_json(nlohmann::json& j, const TelemetrySnapshot& s);

// "degrading" / "accelerating" / "stable" from a duration window
std::string compute_trend(const std::deque<double>& durations);

/**
 * Process-lifetime counters of one orchestrator.
 *
 * Written by the processing path only; status readers take a snapshot.
 * Every member is bounded: the last 50 durations, the last 50 errors and a
 * 48 slot ring of hourly completion counts keyed by UTC hour.
 */
class PipelineStats {
public:
    explicit PipelineStats(bool stall_alert = true,
                           SystemClock::time_point started = SystemClock::now());

    void record_success(double seconds, SystemClock::time_point at = SystemClock::now());
    void record_failure(const std::string& filename, const std::string& message,
                        const std::string& stage, SystemClock::time_point at = SystemClock::now());

    void set_cursor(const std::string& file, Stage stage);
    void set_cursor(const std::string& file, const std::string& stage, float progress);
    void clear_cursor();

    int processed() const;
    int errors() const;
    std::deque<double> durations() const;
    std::vector<ErrorRecord> error_log() const;
    CurrentOperation current() const;

    TelemetrySnapshot snapshot(int pending_count,
                               SystemClock::time_point now = SystemClock::now()) const;

private:
    struct HourSlot {
        std::int64_t hour = -1;
        int count = 0;
    };

    std::vector<Alert> compute_alerts(const TelemetrySnapshot& s, const std::string& ts) const;

    bool stall_alert_;
    SystemClock::time_point started_;

    int processed_ = 0;
    int errors_ = 0;
    std::deque<double> durations_;
    std::deque<ErrorRecord> error_log_;
    std::array<HourSlot, kTimelineHours> hours_{};
    CurrentOperation current_;

    mutable std::mutex mutex_;
};

} // namespace slide_ingest::pipeline
