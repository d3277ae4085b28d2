#pragma once

/** \file worker_pool.hpp
 *  \brief Fixed-size FIFO thread pool used to acquire and encode catalog
 *  images in parallel during a rebuild.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace iris::core {

class WorkerPool {
public:
    /** \param num_threads Number of worker threads (0 = hardware concurrency / 2) */
    explicit WorkerPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~WorkerPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** \brief Submit a task; throws std::runtime_error after shutdown began. */
    template<typename Func>
    auto submit(Func&& func) -> std::future<decltype(func())> {
        using return_type = decltype(func());

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("worker pool is stopped");
            }
            tasks_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    /** \brief Run func(i) for i in [start, end) and wait for all of them.
     *
     * Exceptions thrown by func are rethrown here after every chunk finished.
     */
    template<typename Func>
    auto parallel_for(std::size_t start, std::size_t end, Func&& func) -> void {
        if (start >= end) return;
        const std::size_t chunk_size =
            std::max<std::size_t>(1, (end - start) / (workers_.size() * 4));

        std::vector<std::future<void>> futures;
        for (std::size_t i = start; i < end; i += chunk_size) {
            auto chunk_end = std::min(i + chunk_size, end);
            futures.push_back(submit([i, chunk_end, &func] {
                for (std::size_t j = i; j < chunk_end; ++j) {
                    func(j);
                }
            }));
        }
        for (auto& f : futures) f.wait();
        for (auto& f : futures) f.get();
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

private:
    auto worker_loop() -> void {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), "iris-worker");
#endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace iris::core
