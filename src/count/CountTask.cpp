#include "count/CountTask.hpp"
#include "count/Aggregator.hpp"
#include "logging/LogRegistry.hpp"

using namespace lc::count;
using namespace lc::types;
using namespace lc::logging;

CountTask::CountTask(std::shared_ptr<const discovery::FileList> files,
                     const std::size_t begin_, const std::size_t end_,
                     const CountMode mode,
                     const ClassifierOptions& options,
                     std::shared_ptr<std::atomic<bool>> interruptFlag)
    : files(std::move(files)), begin(begin_), end(end_), mode(mode), options(options),
      interruptFlag(std::move(interruptFlag)) {}

lc::concurrency::PartialResult CountTask::run() {
    auto partial = Aggregator::identity(mode);

    for (std::size_t i = begin; i < end; ++i) {
        if (interruptFlag->load()) throw TaskInterrupted("[CountTask] Interrupted before " + (*files)[i].string());
        const auto& path = (*files)[i];
        Aggregator::accumulate(partial, path, LineClassifier::classify(path, options));
    }

    return partial;
}

void CountTask::onFailure(const std::exception& e) {
    if (dynamic_cast<const TaskInterrupted*>(&e)) return;
    LogRegistry::concurrency()->debug("[CountTask] Range [{}, {}) failed: {}", begin, end, e.what());
    interruptFlag->store(true);
}
