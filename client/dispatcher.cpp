#include "dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>

bool RunState::try_claim()
{
    long long current = remaining.load();
    while (current > 0) {
        if (remaining.compare_exchange_weak(current, current - 1)) {
            return true;
        }
    }
    return false;
}

Dispatcher::Dispatcher(long long requests, long long concurrency)
    : requests(requests), concurrency(concurrency)
{
    if (requests < 1 || concurrency < 1) {
        throw std::invalid_argument("requests and concurrency must be positive");
    }
}

long long Dispatcher::slot_count() const
{
    return std::min(requests, concurrency);
}

unsigned Dispatcher::worker_count() const
{
    unsigned wanted = worker_threads;
    if (wanted == 0) {
        wanted = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned>(std::min<long long>(wanted, slot_count()));
}

bool Dispatcher::interrupted() const
{
    return interrupt_flag != nullptr && interrupt_flag->load();
}

DispatchResult Dispatcher::run(const IRequestExecutor& prototype)
{
    const unsigned workers = worker_count();
    boost::asio::io_context ioc(static_cast<int>(workers));
    RunState state(requests);

    // Declared after ioc so every executor is destroyed before it
    std::vector<std::unique_ptr<IRequestExecutor>> slots;
    slots.reserve(static_cast<size_t>(slot_count()));
    for (long long i = 0; i < slot_count(); ++i) {
        slots.push_back(prototype.clone(ioc));
    }

    state.start_time = std::chrono::steady_clock::now();

    for (auto& slot : slots) {
        IRequestExecutor* executor = slot.get();
        boost::asio::post(ioc, [this, &ioc, &state, executor]() {
            claim_next(ioc, state, *executor);
        });
    }

    // --- Worker Threads ---
    std::mutex failure_mtx;
    std::exception_ptr failure;
    auto drive = [&ioc, &failure_mtx, &failure]() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(failure_mtx);
            std::cerr << "[Dispatcher] Worker stopped: " << e.what() << std::endl;
            if (!failure) failure = std::current_exception();
            ioc.stop();
        }
    };

    // The calling thread is one of the workers
    std::vector<std::thread> threads;
    for (unsigned i = 1; i < workers; ++i) {
        try {
            threads.emplace_back(drive);
        } catch (const std::system_error& e) {
            std::cerr << "[Dispatcher] Could only start " << threads.size() + 1 << " of "
                      << workers << " worker threads: " << e.what() << std::endl;
            break;
        }
    }
    drive();
    for (auto& t : threads) t.join();

    if (failure) {
        std::rethrow_exception(failure);
    }

    DispatchResult result;
    result.elapsed = std::chrono::steady_clock::now() - state.start_time;
    result.aggregate = state.aggregator.snapshot();
    result.interrupted = result.aggregate.total() != requests;
    result.worker_threads = static_cast<unsigned>(threads.size() + 1);

    if (verbose) {
        std::cerr << "[Dispatcher] " << result.aggregate.total() << "/" << requests
                  << " requests completed on " << slots.size() << " slots, "
                  << result.worker_threads << " threads"
                  << (result.interrupted ? " (interrupted)" : "") << std::endl;
    }
    return result;
}

/**
 * @brief One step of a slot: claim a unit and start it. The completion
 * folds the outcome and schedules the next step.
 *
 * @param ioc       The run's io_context.
 * @param state     Shared countdown and aggregator of this run.
 * @param executor  This slot's own executor clone.
 */
void Dispatcher::claim_next(boost::asio::io_context& ioc, RunState& state,
                            IRequestExecutor& executor)
{
    if (interrupted() || !state.try_claim()) {
        return;
    }

    executor.async_execute([this, &ioc, &state, &executor](Outcome outcome) {
        on_outcome(state, outcome);
        boost::asio::post(ioc, [this, &ioc, &state, &executor]() {
            claim_next(ioc, state, executor);
        });
    });
}

void Dispatcher::on_outcome(RunState& state, const Outcome& outcome)
{
    long long done = state.aggregator.fold(outcome);
    if (verbose && done % progress_every == 0) {
        double elapsed_sec = std::max(1e-6, std::chrono::duration<double>(
            std::chrono::steady_clock::now() - state.start_time).count());
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1)
           << "[Dispatcher] Progress: " << done << "/" << requests << " requests ("
           << (100.0 * static_cast<double>(done) / static_cast<double>(requests)) << "%), "
           << std::setprecision(2) << (static_cast<double>(done) / elapsed_sec) << " req/s\n";
        std::cerr << ss.str();
    }
}
