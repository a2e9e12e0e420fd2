#pragma once

#include <map>
#include <mutex>
#include <string>

#include "latency_histogram.hpp"
#include "outcome.hpp"

// Frozen copy of the aggregator state, taken once a run has joined.
struct AggregateSnapshot {
    long long successful = 0;
    long long failed = 0;
    LatencyHistogram latencies;
    std::map<std::string, long long> error_counts;

    long long total() const { return successful + failed; }
};

/**
 * @brief Folds outcomes from many slots into one set of counters.
 *
 * fold() may be called concurrently from any number of threads; every
 * update happens inside one critical section, so the final state does not
 * depend on completion order.
 */
class ResultAggregator {
    mutable std::mutex mtx;
    AggregateSnapshot state;

public:
    ResultAggregator() = default;
    ResultAggregator(const ResultAggregator&) = delete;
    ResultAggregator& operator=(const ResultAggregator&) = delete;

    // Returns how many outcomes have been folded so far, this one included.
    long long fold(const Outcome& outcome);

    AggregateSnapshot snapshot() const;
};
