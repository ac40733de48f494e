#pragma once

#include "slide_ingest/config/configuration.hpp"
#include "slide_ingest/core/events.hpp"
#include "slide_ingest/core/job_supervisor.hpp"
#include "slide_ingest/core/types.hpp"
#include "slide_ingest/core/worker_pool.hpp"
#include "slide_ingest/dedup/duplicate_detector.hpp"
#include "slide_ingest/image/enhancement.hpp"
#include "slide_ingest/ingest/ingest_namer.hpp"
#include "slide_ingest/pipeline/collaborators.hpp"
#include "slide_ingest/pipeline/pipeline_stats.hpp"
#include "slide_ingest/watch/stability_watcher.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace slide_ingest::pipeline {

enum class FileOutcome {
    COMPLETED,
    FAILED,
    SKIPPED  // inbound exact duplicate left in place
};

std::string file_outcome_to_string(FileOutcome outcome);

/**
 * Drives scans through ingest -> enhance -> save -> tag/persist, one file
 * at a time.
 *
 * Watchers (one per input directory) only enqueue; a single run-loop thread
 * drains the FIFO queue. process_file() and process_archived_file() hold the
 * processing slot for their whole duration, so direct calls from other
 * threads serialize with the run loop. Pixel work runs on the worker pool.
 *
 * Per-file failures are recorded in the stats, emitted as events and sent to
 * the status sink; they never escape to the watcher or the run loop.
 */
class Orchestrator {
public:
    Orchestrator(const config::Config& cfg, PersistenceSink& persistence,
                 core::EventEmitter& events, Tagger* tagger = nullptr,
                 StatusSink* status = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Watchers, run loop and the supervised startup scan + recovery.
    void start();
    // Stops watchers, lets the in-flight file finish, joins everything.
    void stop();
    bool running() const;

    void enqueue(const fs::path& path);
    size_t queued() const;

    FileOutcome process_file(const fs::path& path);
    FileOutcome process_archived_file(const fs::path& archived);

    // Archived TIFFs whose <stem>.jpg is missing go through
    // process_archived_file(). Returns the number attempted.
    int recover_unprocessed();

    void handle_output_deletion(const fs::path& path);

    // Files waiting in input dirs or the queue (inbound duplicates left in
    // place excluded) + archived TIFFs without output
    int pending_count() const;
    TelemetrySnapshot telemetry() const;

    // Emits alerts that were not active at the previous call. The run loop
    // calls this whenever the queue drains.
    void publish_alerts();

    PipelineStats& stats() { return stats_; }
    const PipelineStats& stats() const { return stats_; }
    image::EnhancementEngine& engine() { return engine_; }
    dedup::DuplicateDetector& detector() { return detector_; }
    const core::JobSupervisor& supervisor() const { return supervisor_; }

private:
    struct FileRun {
        std::string file;
        Stage stage = Stage::QUEUED;
        SteadyClock::time_point started;
    };

    void run_loop();
    bool stop_requested() const;
    FileOutcome process_archived_locked(const fs::path& archived);
    void enter(FileRun& run, Stage stage);
    void finish(FileRun& run, const fs::path& original, const fs::path& archived);
    void remove_outputs(const SavedOutputs& saved);
    void fail(FileRun& run, const std::string& filename, const std::exception& e);
    void publish(const StatusUpdate& update);
    bool skip_inbound_duplicate(const fs::path& path);
    std::vector<Tag> tag(const fs::path& enhanced);
    fs::path output_stem_for(const fs::path& archived) const;

    config::Config cfg_;
    PersistenceSink& persistence_;
    core::EventEmitter& events_;
    Tagger* tagger_;
    StatusSink* status_;

    core::WorkerPool pool_;
    ingest::IngestNamer namer_;
    image::EnhancementEngine engine_;
    dedup::DuplicateDetector detector_;
    image::SaveOptions save_options_;
    PipelineStats stats_;
    core::JobSupervisor supervisor_;

    std::mutex processing_mutex_;

    std::deque<fs::path> queue_;
    std::set<fs::path> skipped_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool stopping_ = false;
    bool running_ = false;
    std::thread run_thread_;

    std::vector<std::unique_ptr<watch::StabilityWatcher>> input_watchers_;
    std::unique_ptr<watch::StabilityWatcher> output_watcher_;

    std::set<std::string> active_alerts_;
    std::mutex alerts_mutex_;
};

} // namespace slide_ingest::pipeline
