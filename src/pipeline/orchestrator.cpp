#include "slide_ingest/pipeline/orchestrator.hpp"
#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/core/json_io.hpp"
#include "slide_ingest/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>
#include <system_error>

namespace slide_ingest::pipeline {

namespace {

// Clears the stats cursor however the file run ends
class CursorReset {
public:
    explicit CursorReset(PipelineStats& stats) : stats_(stats) {}
    ~CursorReset() { stats_.clear_cursor(); }

    CursorReset(const CursorReset&) = delete;
    CursorReset& operator=(const CursorReset&) = delete;

private:
    PipelineStats& stats_;
};

std::chrono::milliseconds to_millis(float seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0f));
}

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << seconds << "s";
    return oss.str();
}

} // namespace

std::string file_outcome_to_string(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::COMPLETED: return "completed";
        case FileOutcome::FAILED: return "failed";
        case FileOutcome::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

Orchestrator::Orchestrator(const config::Config& cfg, PersistenceSink& persistence,
                           core::EventEmitter& events, Tagger* tagger, StatusSink* status)
    : cfg_(cfg),
      persistence_(persistence),
      events_(events),
      tagger_(tagger),
      status_(status),
      pool_(cfg.runtime.workers),
      namer_(cfg.paths.archive_dir),
      engine_(image::EnhancementSettings::from_config(cfg.enhancement), cfg.enhancement.face_cascade),
      detector_(cfg.duplicates.threshold, &pool_),
      save_options_(image::SaveOptions::from_config(cfg.output)),
      stats_(cfg.runtime.stall_alert) {
    if (tagger_ != nullptr && !tagger_->available()) {
        core::log_line("PIPELINE", "Tagger unavailable, auto-tagging disabled");
    }
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::start() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (running_) {
            throw PipelineError("orchestrator already running");
        }
        running_ = true;
        stopping_ = false;
    }

    core::log_line("PIPELINE", "Starting processing pipeline...");

    for (const auto& dir : {cfg_.paths.archive_dir, cfg_.paths.output_dir}) {
        try {
            core::ensure_directory(dir);
        } catch (const TransientIOError& e) {
            core::log_line("PIPELINE", e.what());
        }
    }

    try {
        watch::WatcherOptions input_options;
        input_options.debounce = to_millis(cfg_.watcher.debounce_seconds);
        input_options.poll_interval = std::chrono::milliseconds(cfg_.watcher.poll_interval_ms);

        core::log_line("PIPELINE", "Setting up watchers for " +
                                       std::to_string(cfg_.paths.input_dirs.size()) + " input directories");
        for (const auto& dir : cfg_.paths.input_dirs) {
            std::error_code ec;
            if (!fs::is_directory(dir, ec)) {
                core::log_line("PIPELINE", "Input directory does not exist: " + dir);
                events_.warning("input directory does not exist: " + dir);
                continue;
            }
            auto watcher = std::make_unique<watch::StabilityWatcher>(
                dir, [this](const fs::path& p) { enqueue(p); }, watch::FileCallback{}, input_options);
            watcher->start();
            input_watchers_.push_back(std::move(watcher));
        }

        watch::WatcherOptions output_options = input_options;
        output_options.debounce = to_millis(cfg_.watcher.output_debounce_seconds);
        output_watcher_ = std::make_unique<watch::StabilityWatcher>(
            cfg_.paths.output_dir, watch::FileCallback{},
            [this](const fs::path& p) {
                supervisor_.launch("output-deletion:" + p.filename().string(),
                                   [this, p]() { handle_output_deletion(p); });
            },
            output_options);
        output_watcher_->start();
    } catch (const std::exception&) {
        // watchers already started are torn down again
        stop();
        throw;
    }

    run_thread_ = std::thread([this]() { run_loop(); });

    supervisor_.launch("startup-scan", [this]() {
        for (auto& watcher : input_watchers_) {
            if (stop_requested()) return;
            core::log_line("PIPELINE", "Processing existing files in " + watcher->directory().string());
            watcher->scan_existing();
        }
        recover_unprocessed();
    });

    core::log_line("PIPELINE", "Pipeline started successfully");
}

void Orchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return;
        stopping_ = true;
    }

    for (auto& watcher : input_watchers_) {
        watcher->stop();
    }
    if (output_watcher_) {
        output_watcher_->stop();
    }

    queue_cv_.notify_all();
    if (run_thread_.joinable()) {
        run_thread_.join();
    }
    supervisor_.join_all();

    input_watchers_.clear();
    output_watcher_.reset();

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dropped = queue_.size();
        queue_.clear();
        running_ = false;
    }
    if (dropped > 0) {
        core::log_line("PIPELINE", std::to_string(dropped) +
                                       " queued file(s) left in place for the next run");
    }
    core::log_line("PIPELINE", "Pipeline stopped");
}

bool Orchestrator::running() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return running_;
}

bool Orchestrator::stop_requested() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return stopping_;
}

void Orchestrator::enqueue(const fs::path& path) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        skipped_.erase(path);
        if (std::find(queue_.begin(), queue_.end(), path) != queue_.end()) return;
        queue_.push_back(path);
    }
    queue_cv_.notify_one();
}

size_t Orchestrator::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void Orchestrator::run_loop() {
    while (true) {
        fs::path next;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) break;
            next = queue_.front();
            queue_.pop_front();
        }

        std::error_code ec;
        if (!fs::exists(next, ec)) {
            core::log_line("PIPELINE", "File vanished before processing: " + next.string());
            continue;
        }

        process_file(next);
        // mid-batch the cursor is briefly idle with the next file still waiting
        if (queued() == 0) {
            publish_alerts();
        }
    }
}

void Orchestrator::publish(const StatusUpdate& update) {
    if (status_ == nullptr) return;
    try {
        status_->publish(update);
    } catch (const std::exception& e) {
        core::log_line("PIPELINE", std::string("Status update failed: ") + e.what());
    }
}

void Orchestrator::enter(FileRun& run, Stage stage) {
    run.stage = stage;
    stats_.set_cursor(run.file, stage);
    events_.stage_start(run.file, stage);
    publish({run.file, stage, stage_progress(stage), ""});
}

std::vector<Tag> Orchestrator::tag(const fs::path& enhanced) {
    if (tagger_ == nullptr || !tagger_->available()) return {};
    try {
        return tagger_->generate_tags(enhanced);
    } catch (const std::exception& e) {
        core::log_line("PIPELINE", "Failed to generate tags for " + enhanced.filename().string() +
                                       ": " + e.what());
        return {};
    }
}

fs::path Orchestrator::output_stem_for(const fs::path& archived) const {
    return fs::path(cfg_.paths.output_dir) / archived.stem();
}

void Orchestrator::finish(FileRun& run, const fs::path& original, const fs::path& archived) {
    enter(run, Stage::ENHANCING);
    const bool auto_quality = cfg_.enhancement.auto_quality;
    EnhancementResult result = pool_.run([this, &archived, auto_quality]() {
        return engine_.process(archived, auto_quality);
    });

    enter(run, Stage::SAVING);
    const fs::path stem = output_stem_for(archived);
    SavedOutputs saved = pool_.run([this, &result, &stem]() {
        return engine_.save(result, stem, save_options_);
    });

    enter(run, Stage::TAGGING);
    const fs::path& jpg = saved.at(OutputFormat::JPEG);
    const std::vector<Tag> tags = tag(jpg);
    try {
        persistence_.upsert(original, archived, jpg, result, tags);
    } catch (const std::exception&) {
        // no output without a catalog entry; recovery picks the file up again
        remove_outputs(saved);
        throw;
    }

    const double seconds = std::chrono::duration<double>(SteadyClock::now() - run.started).count();
    stats_.record_success(seconds);

    run.stage = Stage::COMPLETE;
    publish({run.file, Stage::COMPLETE, stage_progress(Stage::COMPLETE), ""});

    nlohmann::json extra = {
        {"archived", archived.string()},
        {"outputs", saved_outputs_to_json(saved)},
        {"result", result},
        {"tags", tags}
    };
    events_.file_complete(run.file, seconds, extra);
    core::log_line("PIPELINE", "Successfully processed " + run.file + " in " + format_seconds(seconds));
}

void Orchestrator::remove_outputs(const SavedOutputs& saved) {
    for (const auto& [format, path] : saved) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            core::log_line("PIPELINE", "Cannot remove " + output_format_to_string(format) + " output " +
                                           path.string() + ": " + ec.message());
        }
    }
}

void Orchestrator::fail(FileRun& run, const std::string& filename, const std::exception& e) {
    const std::string stage = stage_to_string(run.stage);
    stats_.record_failure(filename, e.what(), stage);
    core::log_line("PIPELINE", "Error processing " + filename + " during " + stage + ": " + e.what());
    events_.file_error(run.file, run.stage, e.what());
    publish({run.file, Stage::ERROR, stage_progress(Stage::ERROR), e.what()});
}

bool Orchestrator::skip_inbound_duplicate(const fs::path& path) {
    const auto archived = core::discover_images(cfg_.paths.archive_dir, true);
    if (archived.empty()) return false;

    const InboundScanReport report = detector_.scan_inbound(std::vector<fs::path>{path}, archived);
    // input names get reused by the next batch; only archived hashes stay cached
    detector_.evict(path);
    if (report.records.empty()) return false;

    events_.duplicate_scan(report);
    const InboundDuplicate& d = report.records.front();
    if (d.action == DuplicateAction::SKIP) {
        core::log_line("DEDUP", "Skipping exact duplicate " + path.filename().string() + " of " +
                                    d.match.filename().string());
        return true;
    }
    events_.warning("near duplicate: " + path.filename().string() + " ~ " + d.match.filename().string());
    return false;
}

FileOutcome Orchestrator::process_file(const fs::path& path) {
    std::lock_guard<std::mutex> slot(processing_mutex_);
    CursorReset reset(stats_);

    FileRun run{path.filename().string(), Stage::QUEUED, SteadyClock::now()};
    try {
        if (cfg_.duplicates.auto_skip && skip_inbound_duplicate(path)) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            skipped_.insert(path);
            return FileOutcome::SKIPPED;
        }

        enter(run, Stage::INGESTING);
        const fs::path archived = namer_.ingest(path);
        run.file = archived.filename().string();

        finish(run, path, archived);
        return FileOutcome::COMPLETED;
    } catch (const std::exception& e) {
        fail(run, path.filename().string(), e);
        return FileOutcome::FAILED;
    }
}

FileOutcome Orchestrator::process_archived_locked(const fs::path& archived) {
    CursorReset reset(stats_);

    FileRun run{archived.filename().string(), Stage::QUEUED, SteadyClock::now()};
    try {
        finish(run, archived, archived);
        return FileOutcome::COMPLETED;
    } catch (const std::exception& e) {
        fail(run, archived.filename().string(), e);
        return FileOutcome::FAILED;
    }
}

FileOutcome Orchestrator::process_archived_file(const fs::path& archived) {
    std::lock_guard<std::mutex> slot(processing_mutex_);
    return process_archived_locked(archived);
}

int Orchestrator::recover_unprocessed() {
    core::log_line("RECOVERY", "Scanning archive for unprocessed files...");

    int attempted = 0;
    for (const auto& archived : core::discover_tiffs(cfg_.paths.archive_dir)) {
        if (stop_requested()) break;

        std::lock_guard<std::mutex> slot(processing_mutex_);
        // the run loop may have finished this one while we waited for the slot
        std::error_code ec;
        if (fs::exists(output_stem_for(archived).string() + ".jpg", ec)) continue;

        ++attempted;
        core::log_line("RECOVERY", "Processing existing archived file: " + archived.filename().string());
        process_archived_locked(archived);
    }

    if (attempted > 0) {
        core::log_line("RECOVERY", "Processed " + std::to_string(attempted) +
                                       " existing files from the archive");
    } else {
        core::log_line("RECOVERY", "No unprocessed files found in the archive");
    }
    return attempted;
}

void Orchestrator::handle_output_deletion(const fs::path& path) {
    const std::string filename = path.filename().string();
    core::log_line("PIPELINE", "Handling deletion of: " + filename);
    persistence_.remove(filename);
    events_.file_deleted(filename);
}

int Orchestrator::pending_count() const {
    // a queued file is still in its input directory until ingest moves it
    std::set<fs::path> waiting;
    for (const auto& dir : cfg_.paths.input_dirs) {
        for (const auto& p : core::discover_images(dir, true)) {
            waiting.insert(p);
        }
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        waiting.insert(queue_.begin(), queue_.end());
        for (const auto& p : skipped_) {
            waiting.erase(p);
        }
    }
    int count = static_cast<int>(waiting.size());

    for (const auto& archived : core::discover_tiffs(cfg_.paths.archive_dir)) {
        std::error_code ec;
        if (!fs::exists(output_stem_for(archived).string() + ".jpg", ec)) {
            ++count;
        }
    }
    return count;
}

TelemetrySnapshot Orchestrator::telemetry() const {
    return stats_.snapshot(pending_count());
}

void Orchestrator::publish_alerts() {
    const TelemetrySnapshot snap = telemetry();

    std::lock_guard<std::mutex> lock(alerts_mutex_);
    std::set<std::string> active;
    for (const auto& alert : snap.alerts) {
        active.insert(alert.type);
        if (active_alerts_.count(alert.type) == 0) {
            core::log_line("PIPELINE", "[" + alert.severity + "] " + alert.message);
            events_.alert(alert);
        }
    }
    active_alerts_ = std::move(active);
}

} // namespace slide_ingest::pipeline
