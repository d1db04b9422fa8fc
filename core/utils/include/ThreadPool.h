#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <cstddef>

namespace Ferry {

    /**
     * @brief Fixed-size worker pool with bounded admission
     *
     * At most threadCount tasks are admitted at any time (queued or running).
     * tryEnqueue() refuses work beyond that instead of queueing it, so a
     * caller can reject excess load immediately.
     */
    class ThreadPool {
    public:
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Admit a task if a worker slot is free
         * @return false if the pool is saturated or shutting down
         */
        bool tryEnqueue(std::function<void()> task);

        std::size_t inFlight() const;
        std::size_t capacity() const { return capacity_; }

        /**
         * @brief Block until every admitted task has finished
         */
        void waitIdle();

        /**
         * @brief Stop admitting work, drain admitted tasks and join workers
         */
        void shutdown();

    private:
        void workerLoop();

        std::size_t capacity_;
        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::condition_variable idleCv_;
        std::size_t inFlight_{0};
        bool stopping_{false};
    };

} // namespace Ferry
