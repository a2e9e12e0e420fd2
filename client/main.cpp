#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "cli_args.hpp"
#include "load_runner.hpp"
#include "utils.h"

// --- Global Stop Flag ---
// Raised by SIGINT/SIGTERM; slots stop claiming new requests once it is set.
std::atomic<bool> interrupt_requested{false};

extern "C" void handle_interrupt(int /*signum*/)
{
    interrupt_requested.store(true);
}

int main(int argc, char* argv[])
{
    CliOptions options;
    LoadTestConfig config;

    try {
        options = parse_cli_args(argc, argv);
        if (options.show_help) {
            std::cout << usage(argv[0]);
            return 0;
        }
        config = to_load_test_config(options);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    RunOptions run_options;
    run_options.interrupt_flag = &interrupt_requested;
    run_options.verbose = options.verbose;
    run_options.worker_threads = options.worker_threads;

    LoadTestReport report;
    try {
        report = run_load_test(config, run_options);
    } catch (const RunInterrupted& e) {
        std::cerr << "Interrupted: " << e.what() << ". No report emitted.\n";
        return 130;
    } catch (const std::exception& e) {
        std::cerr << "Error running load test: " << e.what() << "\n";
        return 1;
    }

    if (options.format == OutputFormat::Json) {
        std::cout << report_to_json(report).dump(2) << std::endl;
    } else {
        std::cout << format_report_text(report) << std::flush;
    }

    return report.status == "completed" ? 0 : 1;
}
