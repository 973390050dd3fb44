#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <utility>
#include <vector>
#include <stdexcept>

namespace pcopy::infra {

// Fixed-size worker pool. Each task runs on exactly one worker; a worker
// blocked in I/O stalls only its own task.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    void enqueue(F&& f);

    // Blocks until the queue is empty and no task is running, then rethrows
    // the first exception a task let escape since the previous wait().
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    void worker_loop_(std::stop_token st);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable_any task_cv_;
    std::condition_variable_any idle_cv_;
    std::size_t active_tasks_ = 0;
    std::exception_ptr first_error_;
    bool stop_ = false;
};

template<typename F>
void ThreadPool::enqueue(F&& f) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace(std::forward<F>(f));
    }
    task_cv_.notify_one();
}

inline ThreadPool::ThreadPool(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    task_cv_.notify_all();
    // jthread requests stop and joins; queued tasks that never started are dropped
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            task_cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
            if (st.stop_requested() || stop_ || tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        std::exception_ptr error;
        try {
            task();
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard lock(queue_mutex_);
            if (error && !first_error_) {
                first_error_ = std::move(error);
            }
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
    if (first_error_) {
        std::rethrow_exception(std::exchange(first_error_, nullptr));
    }
}

} // namespace pcopy::infra
