#include "ThreadPool.h"
#include "Logger.h"

#include <exception>

namespace Ferry {

    ThreadPool::ThreadPool(std::size_t threadCount) {
        if (threadCount == 0) {
            auto hw = std::thread::hardware_concurrency();
            threadCount = hw == 0 ? 1 : hw;
        }
        capacity_ = threadCount;

        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    bool ThreadPool::tryEnqueue(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || inFlight_ >= capacity_) {
                return false;
            }
            ++inFlight_;
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    std::size_t ThreadPool::inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inFlight_;
    }

    void ThreadPool::waitIdle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idleCv_.wait(lock, [this]() { return inFlight_ == 0; });
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }

        cv_.notify_all();

        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }

        workers_.clear();
    }

    void ThreadPool::workerLoop() {
        for (;;) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() {
                    return stopping_ || !tasks_.empty();
                });

                if (stopping_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().error(std::string("Worker task threw: ") + e.what(), "ThreadPool");
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --inFlight_;
                if (inFlight_ == 0) {
                    idleCv_.notify_all();
                }
            }
        }
    }

} // namespace Ferry
