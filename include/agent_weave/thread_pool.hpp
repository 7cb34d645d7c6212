#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace agent_weave {

/**
 * Fixed-size thread pool running dispatched executions
 * Results and exceptions travel back to the submitter through futures
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency())
        : num_threads_(num_threads == 0 ? 1 : num_threads)
    {
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a callable; the returned future carries its result or exception
     */
    template<typename F>
    auto submit(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto job = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
        auto future = job->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                throw std::runtime_error("ThreadPool is shutdown");
            }
            jobs_.emplace_back([job]() { (*job)(); });
        }
        cv_.notify_one();
        return future;
    }

    /**
     * Stop accepting work, drain what is queued and join the workers
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t num_threads() const { return num_threads_; }

    size_t pending_jobs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            // packaged_task stores any exception in the future
            job();
        }
    }

    size_t num_threads_;
    bool running_{true};
    std::deque<std::function<void()>> jobs_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace agent_weave
