#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

#include "LoadTestConfig.h"
#include "LoadTestReport.h"
#include "request_executor.hpp"

/**
 * @brief Thrown when a run was stopped by an interrupt before every unit
 * completed. No report exists for such a run.
 */
class RunInterrupted : public std::runtime_error {
public:
    RunInterrupted(long long completed, long long requested);

    long long completed;
    long long requested;
};

struct RunOptions {
    const std::atomic<bool>* interrupt_flag = nullptr;
    bool verbose = false;
    unsigned worker_threads = 0;    // 0 = number of hardware threads
};

/**
 * @brief Validates the config, runs it against its HTTP target and builds
 * the report.
 *
 * @throws ConfigError      if the config is invalid (nothing is dispatched).
 * @throws RunInterrupted   if the interrupt flag stopped the run.
 * @return A "completed" report, or a "failed" one when no HTTP client can be
 *         built for the target.
 */
LoadTestReport run_load_test(const LoadTestConfig& config, const RunOptions& options = {});

// Same, with a caller-supplied executor prototype that every slot clones.
LoadTestReport run_load_test(const LoadTestConfig& config, const IRequestExecutor& prototype,
                             const RunOptions& options = {});
