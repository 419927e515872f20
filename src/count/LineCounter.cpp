#include "count/LineCounter.hpp"
#include "count/Aggregator.hpp"
#include "count/CountTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/task.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace lc::count;
using namespace lc::types;
using namespace lc::discovery;
using namespace lc::concurrency;
using namespace lc::config;
using namespace lc::logging;

AggregateResult LineCounter::run(const FileList& files, const CountMode mode, const unsigned int parallelism) {
    const auto& cnf = ConfigRegistry::get().counting;
    return run(files, mode, parallelism, {
        .classifier = {.validate_utf8 = cnf.validate_utf8},
        .tasks_per_worker = cnf.tasks_per_worker
    });
}

AggregateResult LineCounter::run(const FileList& files, const CountMode mode,
                                 const unsigned int parallelism, const CountOptions& opts) {
    LogRegistry::counting()->debug("[LineCounter] Counting {} files ({}) with parallelism {}",
                                   files.size(), to_string(mode), parallelism);

    if (parallelism <= 1 || files.size() < 2) return runSequential(files, mode, opts);
    return runParallel(files, mode, parallelism, opts);
}

FileStat LineCounter::countLines(const FileList& files, const unsigned int parallelism) {
    return std::get<FileStat>(run(files, CountMode::Global, parallelism));
}

ExtensionStats LineCounter::countLinesByExt(const FileList& files, const unsigned int parallelism) {
    return std::get<ExtensionStats>(run(files, CountMode::ByExtension, parallelism));
}

AggregateResult LineCounter::runSequential(const FileList& files, const CountMode mode, const CountOptions& opts) {
    auto result = Aggregator::identity(mode);
    for (const auto& path : files)
        Aggregator::accumulate(result, path, LineClassifier::classify(path, opts.classifier));
    return result;
}

AggregateResult LineCounter::runParallel(const FileList& files, const CountMode mode,
                                         const unsigned int parallelism, const CountOptions& opts) {
    if (files.size() > std::numeric_limits<unsigned int>::max())
        throw std::length_error("[LineCounter] Too many files for one run: " + std::to_string(files.size()));

    const auto shared = std::make_shared<const FileList>(files);
    const auto interruptFlag = std::make_shared<std::atomic<bool> >(false);

    const auto fileCount = static_cast<unsigned int>(files.size());
    const auto wantedTasks = static_cast<uint64_t>(parallelism) * std::max(1u, opts.tasks_per_worker);
    const auto maxTasks = static_cast<unsigned int>(std::min<uint64_t>(wantedTasks, fileCount));
    const auto ranges = getTaskOperationRanges(fileCount, maxTasks, 1);

    // No more workers than there are ranges to hand out
    ThreadPool pool(interruptFlag, std::min(parallelism, static_cast<unsigned int>(ranges.size())));

    std::vector<std::future<lc::concurrency::PartialResult>> futures;
    futures.reserve(ranges.size());

    for (const auto& [begin, end] : ranges) {
        const auto task = std::make_shared<CountTask>(shared, begin, end, mode, opts.classifier, interruptFlag);
        futures.push_back(task->getFuture().value());
        pool.submit(task);
    }

    auto result = Aggregator::identity(mode);
    std::exception_ptr failure;

    // Every future is drained so no task outlives the pool with an unobserved error
    for (auto& f : futures) {
        try {
            const auto partial = f.get();
            if (!failure) Aggregator::merge(result, partial);
        } catch (const TaskInterrupted&) {
            // the task that raised the interrupt carries the real error
        } catch (const std::exception&) {
            if (!failure) failure = std::current_exception();
        }
    }

    pool.stop();

    if (failure) std::rethrow_exception(failure);
    if (interruptFlag->load()) throw std::runtime_error("[LineCounter] Run interrupted without a reported failure");

    LogRegistry::counting()->debug("[LineCounter] Merged {} partial results", ranges.size());
    return result;
}
