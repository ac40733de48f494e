#include "slide_ingest/watch/stability_watcher.hpp"
#include "slide_ingest/core/errors.hpp"
#include "slide_ingest/core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace slide_ingest::watch {

namespace core = slide_ingest::core;

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF;

} // namespace

StabilityWatcher::StabilityWatcher(fs::path directory, FileCallback on_stable,
                                   FileCallback on_deleted, WatcherOptions options)
    : directory_(std::move(directory)),
      on_stable_(std::move(on_stable)),
      on_deleted_(std::move(on_deleted)),
      options_(options) {}

StabilityWatcher::~StabilityWatcher() {
    stop();
}

void StabilityWatcher::start() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (running_) {
            throw PipelineError("watcher already running: " + directory_.string());
        }
        stop_requested_ = false;
        running_ = true;
    }

    try {
        core::ensure_directory(directory_);
    } catch (const TransientIOError& e) {
        // inotify thread keeps retrying the root watch
        core::log_line("WATCHER", e.what());
    }

    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        core::log_line("WATCHER", std::string("inotify unavailable, polling existing pending set only: ") +
                                      std::strerror(errno));
    } else if (::pipe2(wake_pipe_, O_CLOEXEC) != 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
        core::log_line("WATCHER", std::string("cannot create wake pipe: ") + std::strerror(errno));
    }

    if (inotify_fd_ >= 0) {
        // installed before the thread exists so nothing created after start() is missed
        const bool root_watched = install_root_watch();
        inotify_thread_ = std::thread([this, root_watched]() { inotify_loop(root_watched); });
    }
    poll_thread_ = std::thread([this]() { poll_loop(); });

    core::log_line("WATCHER", "Started watching: " + directory_.string());
}

void StabilityWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (wake_pipe_[1] >= 0) {
        const char byte = 1;
        ssize_t n = ::write(wake_pipe_[1], &byte, 1);
        (void)n;
    }

    if (poll_thread_.joinable()) poll_thread_.join();
    if (inotify_thread_.joinable()) inotify_thread_.join();

    for (auto& [wd, dir] : watch_dirs_) {
        ::inotify_rm_watch(inotify_fd_, wd);
    }
    watch_dirs_.clear();
    if (inotify_fd_ >= 0) ::close(inotify_fd_);
    if (wake_pipe_[0] >= 0) ::close(wake_pipe_[0]);
    if (wake_pipe_[1] >= 0) ::close(wake_pipe_[1]);
    inotify_fd_ = -1;
    wake_pipe_[0] = wake_pipe_[1] = -1;

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        running_ = false;
    }
    core::log_line("WATCHER", "Stopped watching: " + directory_.string());
}

bool StabilityWatcher::running() const {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    return running_;
}

void StabilityWatcher::notify_created(const fs::path& path, SteadyClock::time_point now) {
    if (!core::is_supported_image(path)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(path) != 0) return;
    pending_.emplace(path, WatchedFile{path, 0, now});
    core::log_line("WATCHER", "New file detected: " + path.filename().string());
}

void StabilityWatcher::notify_deleted(const fs::path& path) {
    if (!core::is_supported_image(path)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(path);
    }
    if (on_deleted_) {
        invoke(on_deleted_, path, "deletion");
    }
}

size_t StabilityWatcher::poll_once(SteadyClock::time_point now) {
    std::vector<fs::path> stable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            WatchedFile& wf = it->second;

            std::error_code ec;
            const bool exists = fs::exists(wf.path, ec);
            if (!ec && !exists) {
                // partial write that went away
                it = pending_.erase(it);
                continue;
            }

            const std::uintmax_t size = ec ? wf.last_size : fs::file_size(wf.path, ec);
            if (ec) {
                core::log_line("WATCHER", "Error checking file " + wf.path.string() + ": " + ec.message());
                ++it;
                continue;
            }

            if (size == wf.last_size) {
                if (now - wf.last_change >= options_.debounce) {
                    stable.push_back(wf.path);
                    it = pending_.erase(it);
                    continue;
                }
            } else {
                wf.last_size = size;
                wf.last_change = now;
            }
            ++it;
        }
    }

    for (const auto& path : stable) {
        core::log_line("WATCHER", "File stable, processing: " + path.filename().string());
        invoke(on_stable_, path, "stable");
    }
    return stable.size();
}

size_t StabilityWatcher::scan_existing() {
    size_t count = 0;
    for (const auto& path : core::discover_images(directory_, options_.recursive)) {
        core::log_line("WATCHER", "Processing existing file: " + path.filename().string());
        invoke(on_stable_, path, "existing");
        ++count;
    }
    return count;
}

size_t StabilityWatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool StabilityWatcher::is_pending(const fs::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(path) != 0;
}

void StabilityWatcher::invoke(const FileCallback& cb, const fs::path& path, const char* what) {
    if (!cb) return;
    try {
        cb(path);
    } catch (const std::exception& e) {
        core::log_line("WATCHER", std::string("Error in ") + what + " callback for " +
                                      path.string() + ": " + e.what());
    }
}

void StabilityWatcher::poll_loop() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (!stop_requested_) {
        if (stop_cv_.wait_for(lock, options_.poll_interval, [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            poll_once(SteadyClock::now());
        } catch (const std::exception& e) {
            core::log_line("WATCHER", std::string("Stability pass failed: ") + e.what());
        }
        lock.lock();
    }
}

bool StabilityWatcher::install_root_watch() {
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        try {
            core::ensure_directory(directory_);
        } catch (const TransientIOError&) {
            return false;
        }
    }
    add_watch_tree(directory_);
    return !watch_dirs_.empty();
}

void StabilityWatcher::add_watch_tree(const fs::path& dir) {
    int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        core::log_line("WATCHER", "Cannot watch " + dir.string() + ": " + std::strerror(errno));
        return;
    }
    watch_dirs_[wd] = dir;

    if (!options_.recursive) return;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_directory(ec)) {
            add_watch_tree(entry.path());
        }
    }
}

void StabilityWatcher::handle_events(const char* buffer, long length) {
    const SteadyClock::time_point now = SteadyClock::now();
    long offset = 0;
    while (offset < length) {
        const auto* ev = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        offset += static_cast<long>(sizeof(struct inotify_event) + ev->len);

        if (ev->mask & IN_IGNORED) {
            watch_dirs_.erase(ev->wd);
            continue;
        }
        auto it = watch_dirs_.find(ev->wd);
        if (it == watch_dirs_.end() || ev->len == 0) continue;

        const fs::path path = it->second / ev->name;

        if (ev->mask & IN_ISDIR) {
            if ((ev->mask & (IN_CREATE | IN_MOVED_TO)) && options_.recursive) {
                add_watch_tree(path);
                // files may have landed before the watch was installed
                for (const auto& f : core::discover_images(path, true)) {
                    notify_created(f, now);
                }
            }
            continue;
        }

        if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
            notify_created(path, now);
        } else if (ev->mask & (IN_DELETE | IN_MOVED_FROM)) {
            notify_deleted(path);
        }
    }
}

void StabilityWatcher::inotify_loop(bool root_watched) {
    alignas(struct inotify_event) char buffer[16 * 1024];

    while (true) {
        {
            std::lock_guard<std::mutex> lock(stop_mutex_);
            if (stop_requested_) break;
        }

        if (!root_watched) {
            root_watched = install_root_watch();
        }

        struct pollfd fds[2];
        fds[0].fd = inotify_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = wake_pipe_[0];
        fds[1].events = POLLIN;

        const int timeout_ms = static_cast<int>(options_.poll_interval.count());
        const int rc = ::poll(fds, 2, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            core::log_line("WATCHER", std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        if (rc == 0) continue;
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & POLLIN) {
            while (true) {
                const ssize_t n = ::read(inotify_fd_, buffer, sizeof(buffer));
                if (n <= 0) break;
                handle_events(buffer, static_cast<long>(n));
            }
        }
    }
}

} // namespace slide_ingest::watch
