#pragma once

#include <algorithm>
#include <thread>
#include <utility>
#include <vector>

namespace lc::concurrency {

using opRange = std::pair<unsigned int, unsigned int>;

// Splits [0, totalOperations) into contiguous, ordered, non-overlapping ranges
inline std::vector<opRange> getTaskOperationRanges(const unsigned int totalOperations,
                                                   const unsigned int maxThreads = std::thread::hardware_concurrency(),
                                                   const unsigned int minOperationsPerTask = 2) {
    std::vector<opRange> taskOperationRanges;
    if (totalOperations == 0) return taskOperationRanges;

    const unsigned int numThreads = std::max(1u, std::min(totalOperations / std::max(1u, minOperationsPerTask),
                                                          std::max(1u, maxThreads)));
    const unsigned int operationsPerTask = totalOperations / numThreads;
    const unsigned int remainder = totalOperations % numThreads;

    taskOperationRanges.reserve(numThreads);

    unsigned int start = 0;
    for (unsigned int i = 0; i < numThreads; ++i) {
        unsigned int end = start + operationsPerTask;
        if (i < remainder) end++;
        if (start < end) taskOperationRanges.emplace_back(start, end);
        start = end;
    }

    return taskOperationRanges;
}

}
