#include "result_aggregator.hpp"

long long ResultAggregator::fold(const Outcome& outcome)
{
    std::lock_guard<std::mutex> lock(mtx);

    if (const auto* success = std::get_if<SuccessOutcome>(&outcome)) {
        long long micros = success->duration.count();
        if (micros < 0) micros = 0;
        state.successful++;
        state.latencies.record(micros);
        return state.total();
    }

    const auto& failure = std::get<FailureOutcome>(outcome);
    state.failed++;
    state.error_counts[error_label(failure)]++;
    return state.total();
}

AggregateSnapshot ResultAggregator::snapshot() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}
