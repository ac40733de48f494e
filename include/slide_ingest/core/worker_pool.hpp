#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace slide_ingest::core {

/**
 * Fixed-size pool for CPU-bound work (decode, enhance, encode, hashing).
 * submit() returns a future; exceptions thrown by the task are rethrown
 * from future::get().
 */
class WorkerPool {
public:
    explicit WorkerPool(int workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        std::future<R> fut = task->get_future();
        enqueue([task]() { (*task)(); });
        return fut;
    }

    // Runs fn on the pool and blocks the caller until it finishes
    template <typename Fn>
    auto run(Fn&& fn) -> std::invoke_result_t<Fn> {
        return submit(std::forward<Fn>(fn)).get();
    }

    int size() const { return static_cast<int>(threads_.size()); }

    void shutdown();

private:
    void enqueue(std::function<void()> job);
    void worker_loop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace slide_ingest::core
