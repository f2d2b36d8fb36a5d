#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace d20 {

// ==============================================================================
// Worker Pool
// Fixed set of threads draining a FIFO of batch tasks. Each task returns its
// result through a future.
// ==============================================================================

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0) {
        if (num_threads == 0) num_threads = default_thread_count();

        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    static size_t default_thread_count() {
        const size_t n = std::thread::hardware_concurrency();
        return n == 0 ? 4 : n;
    }

    // Queues a callable; throws std::runtime_error once the pool is stopping
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using result_type = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
        std::future<result_type> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    // Blocks until the queue is empty and no task is running
    void wait_all() {
        std::unique_lock<std::mutex> lock(mutex_);
        finished_condition_.wait(lock, [this] { return tasks_.empty() && active_tasks_ == 0; });
    }

    // Stops accepting work; queued tasks still run
    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();
    }

    size_t thread_count() const { return workers_.size(); }
    size_t active_tasks() const { return active_tasks_.load(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable finished_condition_;
    std::atomic<size_t> active_tasks_{0};
    bool stop_ = false;

    void worker_loop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;

                task = std::move(tasks_.front());
                tasks_.pop();
                ++active_tasks_;
            }

            task();

            {
                std::unique_lock<std::mutex> lock(mutex_);
                --active_tasks_;
            }
            finished_condition_.notify_all();
        }
    }
};

// Process-wide pool sized to the hardware
inline ThreadPool& get_thread_pool() {
    static ThreadPool pool;
    return pool;
}

} // namespace d20
