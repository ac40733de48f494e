#include "slide_ingest/core/job_supervisor.hpp"
#include "slide_ingest/core/utils.hpp"

#include <exception>

namespace slide_ingest::core {

JobSupervisor::~JobSupervisor() {
    join_all();
}

void JobSupervisor::launch(const std::string& name, std::function<void()> job) {
    reap_finished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    running_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push_back({std::thread([this, name, done, job = std::move(job)]() {
        try {
            job();
        } catch (const std::exception& e) {
            record_failure(name, e.what());
        }
        running_.fetch_sub(1);
        done->store(true);
    }), done});
}

void JobSupervisor::reap_finished() {
    std::vector<Job> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& j : finished) {
        if (j.thread.joinable()) j.thread.join();
    }
}

void JobSupervisor::join_all() {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.swap(jobs_);
    }
    for (auto& j : jobs) {
        if (j.thread.joinable()) j.thread.join();
    }
}

std::vector<JobFailure> JobSupervisor::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void JobSupervisor::record_failure(const std::string& name, const std::string& message) {
    log_line("SUPERVISOR", "job '" + name + "' failed: " + message);
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back({name, message, get_iso_timestamp()});
    if (failures_.size() > kMaxRecordedFailures) {
        failures_.erase(failures_.begin());
    }
}

} // namespace slide_ingest::core
