#pragma once

#include "concurrency/Task.hpp"
#include "count/LineClassifier.hpp"
#include "discovery/Discoverer.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>

namespace lc::count {

// Raised inside a task that stopped early because another task failed
struct TaskInterrupted : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Classifies files[begin, end) into a partial result delivered through the promise
struct CountTask final : concurrency::PromisedTask {
    std::shared_ptr<const discovery::FileList> files;
    std::size_t begin{};
    std::size_t end{};
    types::CountMode mode;
    ClassifierOptions options;
    std::shared_ptr<std::atomic<bool>> interruptFlag;

    CountTask(std::shared_ptr<const discovery::FileList> files,
              std::size_t begin_, std::size_t end_,
              types::CountMode mode,
              const ClassifierOptions& options,
              std::shared_ptr<std::atomic<bool>> interruptFlag);

protected:
    concurrency::PartialResult run() override;
    void onFailure(const std::exception& e) override;
};

}
