#pragma once

#include "types/stats/FileStat.hpp"

namespace lc::concurrency {

// What a counting task reports back through its future
using PartialResult = types::AggregateResult;

}
