#pragma once

#include <map>
#include <optional>
#include <string>

struct LoadTestReport {
    std::string id;
    std::string status;     // "completed" or "failed"
    long long total_requests = 0;
    long long successful_requests = 0;
    long long failed_requests = 0;
    double requests_per_second = 0.0;
    // Latencies of successful requests only, in milliseconds
    double min_response_time_ms = 0.0;
    double max_response_time_ms = 0.0;
    double mean_response_time_ms = 0.0;
    double median_response_time_ms = 0.0;
    double p95_response_time_ms = 0.0;
    double p99_response_time_ms = 0.0;
    double total_duration_seconds = 0.0;
    // Error label -> count. Empty optional when nothing failed.
    std::optional<std::map<std::string, long long>> error_stats;
};
