#pragma once

#include "slide_ingest/core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace slide_ingest::watch {

namespace fs = std::filesystem;

using FileCallback = std::function<void(const fs::path&)>;

struct WatcherOptions {
    std::chrono::milliseconds debounce{2000};
    std::chrono::milliseconds poll_interval{1000};
    bool recursive = true;
};

/**
 * Turns raw create/delete notifications into "file stable" and "file deleted"
 * signals for one directory tree.
 *
 * A created file enters the pending set with size 0. Each poll re-reads its
 * size: a vanished file is dropped without a callback, a changed size resets
 * the quiet period, and a size that stayed put for at least `debounce` fires
 * on_stable exactly once and removes the entry.
 *
 * Events come from an inotify thread once start() is called; tests can drive
 * the same state machine through notify_created()/notify_deleted() and
 * poll_once() with synthetic time points.
 */
class StabilityWatcher {
public:
    StabilityWatcher(fs::path directory, FileCallback on_stable,
                     FileCallback on_deleted = {}, WatcherOptions options = {});
    ~StabilityWatcher();

    StabilityWatcher(const StabilityWatcher&) = delete;
    StabilityWatcher& operator=(const StabilityWatcher&) = delete;

    void start();
    void stop();
    bool running() const;

    void notify_created(const fs::path& path, SteadyClock::time_point now = SteadyClock::now());
    void notify_deleted(const fs::path& path);

    // One stability pass; returns the number of on_stable callbacks fired.
    size_t poll_once(SteadyClock::time_point now);

    // Feeds every matching file already present straight to on_stable.
    size_t scan_existing();

    size_t pending_count() const;
    bool is_pending(const fs::path& path) const;
    const fs::path& directory() const { return directory_; }

private:
    void poll_loop();
    void inotify_loop(bool root_watched);
    bool install_root_watch();
    void add_watch_tree(const fs::path& dir);
    void handle_events(const char* buffer, long length);
    void invoke(const FileCallback& cb, const fs::path& path, const char* what);

    fs::path directory_;
    FileCallback on_stable_;
    FileCallback on_deleted_;
    WatcherOptions options_;

    std::map<fs::path, WatchedFile> pending_;
    mutable std::mutex mutex_;

    mutable std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
    bool running_ = false;

    std::thread poll_thread_;
    std::thread inotify_thread_;
    int inotify_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};
    std::map<int, fs::path> watch_dirs_;  // inotify thread once started
};

} // namespace slide_ingest::watch
