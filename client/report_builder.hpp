#pragma once

#include <chrono>
#include <string>

#include "LoadTestReport.h"
#include "result_aggregator.hpp"

// Shortest duration a completed run is credited with, so the rate stays finite.
constexpr double kMinRunDurationSeconds = 1e-6;

/**
 * @brief Assembles the final report from a joined run's snapshot.
 * @param id       Run identifier to stamp on the report.
 * @param snapshot Aggregator state after every slot has finished.
 * @param elapsed  Wall clock from first dispatch to last completion.
 */
LoadTestReport build_report(const std::string& id, const AggregateSnapshot& snapshot,
                            std::chrono::steady_clock::duration elapsed);

// Report for a run that never started: status "failed", all counts zero.
LoadTestReport build_failed_report(const std::string& id);
