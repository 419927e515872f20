#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace lc::concurrency;
using namespace lc::logging;

ThreadPool::ThreadPool(const std::shared_ptr<std::atomic<bool> >& interruptFlag,
                       const unsigned int nThreads)
    : interruptFlag(interruptFlag ? interruptFlag : std::make_shared<std::atomic<bool> >(false)), stopFlag(false) {
    threads_.reserve(nThreads);
    try {
        for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
    } catch (const std::exception& e) {
        // The destructor will not run, so the workers already started are joined here
        LogRegistry::concurrency()->error("[ThreadPool] Failed to start worker {} of {}: {}", threads_.size() + 1, nThreads, e.what());
        stop();
        throw;
    }
    LogRegistry::concurrency()->debug("[ThreadPool] Started with {} workers", nThreads);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    if (stopFlag.exchange(true)) return;

    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task> > empty;
        std::swap(queue, empty);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    LogRegistry::concurrency()->debug("[ThreadPool] Stopped {} workers", threads_.size());

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("[ThreadPool] submit() called on a stopped pool");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

bool ThreadPool::isInterrupted() const { return interruptFlag->load(); }

void ThreadPool::interrupt() const { interruptFlag->store(true); }

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (task) {
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    // Promised tasks report through their future; anything reaching here is a task bug
                    LogRegistry::concurrency()->error("[ThreadPool] Task threw outside its promise: {}", e.what());
                    interruptFlag->store(true);
                }
            }
        }
    });
}
