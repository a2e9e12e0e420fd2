#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "request_executor.hpp"
#include "result_aggregator.hpp"

/**
 * @brief Shared state of one run. Lives for exactly one Dispatcher::run().
 */
struct RunState {
    explicit RunState(long long requests) : remaining(requests) {}

    std::atomic<long long> remaining;   // work units not yet claimed
    ResultAggregator aggregator;
    std::chrono::steady_clock::time_point start_time;

    // Takes one unit of work. Returns false once the countdown is at zero;
    // never decrements past it.
    bool try_claim();
};

struct DispatchResult {
    AggregateSnapshot aggregate;
    std::chrono::steady_clock::duration elapsed{};
    bool interrupted = false;
    unsigned worker_threads = 0;
};

/**
 * @brief Runs `requests` attempts with at most min(concurrency, requests)
 * of them in flight.
 *
 * Each slot is an executor clone that keeps claiming units from the shared
 * countdown until it is exhausted, so slow responses on one slot never hold
 * back the others. Slots only wait on asynchronous I/O; all of them share
 * one io_context run by a small fixed set of worker threads.
 */
class Dispatcher {
    long long requests;
    long long concurrency;
    unsigned worker_threads = 0;
    const std::atomic<bool>* interrupt_flag = nullptr;
    bool verbose = false;
    long long progress_every = 100;

public:
    Dispatcher(long long requests, long long concurrency);

    // When set and raised, slots stop claiming new units.
    void set_interrupt_flag(const std::atomic<bool>* flag) { interrupt_flag = flag; }
    void set_verbose(bool on) { verbose = on; }

    // 0 picks the number of hardware threads.
    void set_worker_threads(unsigned count) { worker_threads = count; }

    long long slot_count() const;

    // Threads that run the io_context, never more than there are slots.
    unsigned worker_count() const;

    DispatchResult run(const IRequestExecutor& prototype);

private:
    void claim_next(boost::asio::io_context& ioc, RunState& state, IRequestExecutor& executor);
    void on_outcome(RunState& state, const Outcome& outcome);
    bool interrupted() const;
};
