#include "load_runner.hpp"

#include <iostream>
#include <memory>

#include "dispatcher.hpp"
#include "executors/http_executor.hpp"
#include "report_builder.hpp"
#include "utils.h"

RunInterrupted::RunInterrupted(long long completed, long long requested)
    : std::runtime_error("Run interrupted after " + std::to_string(completed) + " of " +
                         std::to_string(requested) + " requests"),
      completed(completed), requested(requested)
{
}

LoadTestReport run_load_test(const LoadTestConfig& config, const RunOptions& options)
{
    validate_config(config);

    auto shared_config = std::make_shared<const LoadTestConfig>(config);
    HttpRequestExecutor prototype(shared_config);
    return run_load_test(config, prototype, options);
}

LoadTestReport run_load_test(const LoadTestConfig& config, const IRequestExecutor& prototype,
                             const RunOptions& options)
{
    validate_config(config);

    const std::string run_id = generate_run_id();

    if (!prototype.prepare()) {
        std::cerr << "[Runner] Cannot start run " << run_id << ": no client for "
                  << config.url << std::endl;
        return build_failed_report(run_id);
    }

    Dispatcher dispatcher(config.requests, config.concurrency);
    dispatcher.set_interrupt_flag(options.interrupt_flag);
    dispatcher.set_verbose(options.verbose);
    dispatcher.set_worker_threads(options.worker_threads);

    if (options.verbose) {
        std::cerr << "[Runner] Starting load test " << run_id << "\n"
                  << "   Target:      " << to_string(config.method) << " " << config.url << "\n"
                  << "   Requests:    " << config.requests << "\n"
                  << "   Concurrency: " << config.concurrency << "\n"
                  << "   Threads:     " << dispatcher.worker_count() << "\n"
                  << "   Timeout:     " << config.timeout.count() << " ms" << std::endl;
    }

    DispatchResult result = dispatcher.run(prototype);
    if (result.interrupted) {
        throw RunInterrupted(result.aggregate.total(), config.requests);
    }

    return build_report(run_id, result.aggregate, result.elapsed);
}
