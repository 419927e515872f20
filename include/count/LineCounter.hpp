#pragma once

#include "count/LineClassifier.hpp"
#include "discovery/Discoverer.hpp"
#include "types/stats/FileStat.hpp"

namespace lc::count {

struct CountOptions {
    ClassifierOptions classifier;
    unsigned int tasks_per_worker = 4;
};

class LineCounter {
public:
    // Uses the counting section of the registered config
    static types::AggregateResult run(const discovery::FileList& files, types::CountMode mode, unsigned int parallelism);

    /*
     * Classifies every file and folds the stats into one result. parallelism <= 1 runs
     * on the calling thread in list order; otherwise a pool of that many workers is
     * created for this run, each task folds a contiguous range locally, and the partials
     * are merged in range order. The result does not depend on parallelism.
     * The first file that cannot be opened aborts the run with its exception.
     */
    static types::AggregateResult run(const discovery::FileList& files, types::CountMode mode,
                                      unsigned int parallelism, const CountOptions& opts);

    static types::FileStat countLines(const discovery::FileList& files, unsigned int parallelism);

    static types::ExtensionStats countLinesByExt(const discovery::FileList& files, unsigned int parallelism);

private:
    static types::AggregateResult runSequential(const discovery::FileList& files, types::CountMode mode,
                                                const CountOptions& opts);

    static types::AggregateResult runParallel(const discovery::FileList& files, types::CountMode mode,
                                              unsigned int parallelism, const CountOptions& opts);
};

}
