#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lc::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(const std::shared_ptr<std::atomic<bool>>& interruptFlag,
                        unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks, lets running ones finish and joins every worker
    void stop();

    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

    [[nodiscard]] bool isInterrupted() const;

    void interrupt() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::shared_ptr<std::atomic<bool>> interruptFlag;
    std::atomic<bool> stopFlag{false};
};

} // namespace lc::concurrency
