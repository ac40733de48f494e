#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace slide_ingest::core {

constexpr size_t kMaxRecordedFailures = 50;

struct JobFailure {
    std::string job;
    std::string message;
    std::string timestamp;
};

/**
 * Runs background jobs on their own threads behind an error boundary.
 * A failing job is logged and recorded instead of being dropped; only the
 * most recent kMaxRecordedFailures are kept. join_all() waits for every job
 * launched so far.
 */
class JobSupervisor {
public:
    JobSupervisor() = default;
    ~JobSupervisor();

    JobSupervisor(const JobSupervisor&) = delete;
    JobSupervisor& operator=(const JobSupervisor&) = delete;

    void launch(const std::string& name, std::function<void()> job);
    void join_all();

    int running() const { return running_.load(); }
    std::vector<JobFailure> failures() const;

private:
    struct Job {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void record_failure(const std::string& name, const std::string& message);
    // Joins jobs that already returned
    void reap_finished();

    std::vector<Job> jobs_;
    std::vector<JobFailure> failures_;
    mutable std::mutex mutex_;
    std::atomic<int> running_{0};
};

} // namespace slide_ingest::core
