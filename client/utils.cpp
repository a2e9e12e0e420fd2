#include "utils.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

std::string generate_run_id()
{
    // One generator per thread, seeded once
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << "-"
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
       << std::setw(4) << (hi & 0xFFFF) << "-"
       << std::setw(4) << (lo >> 48) << "-"
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

nlohmann::json report_to_json(const LoadTestReport& r)
{
    nlohmann::json j = {
        {"id", r.id},
        {"status", r.status},
        {"total_requests", r.total_requests},
        {"successful_requests", r.successful_requests},
        {"failed_requests", r.failed_requests},
        {"requests_per_second", r.requests_per_second},
        {"min_response_time_ms", r.min_response_time_ms},
        {"max_response_time_ms", r.max_response_time_ms},
        {"mean_response_time_ms", r.mean_response_time_ms},
        {"median_response_time_ms", r.median_response_time_ms},
        {"p95_response_time_ms", r.p95_response_time_ms},
        {"p99_response_time_ms", r.p99_response_time_ms},
        {"total_duration_seconds", r.total_duration_seconds},
    };

    if (r.error_stats.has_value()) {
        j["error_stats"] = *r.error_stats;
    } else {
        j["error_stats"] = nullptr;
    }
    return j;
}

std::string format_report_text(const LoadTestReport& r)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "\n--- Load Test Report (" << r.status << ") ---\n"
       << "Run ID:         " << r.id << "\n"
       << "Total Requests: " << r.total_requests << "\n"
       << "Successful:     " << r.successful_requests << "\n"
       << "Failed:         " << r.failed_requests << "\n"
       << "Duration:       " << r.total_duration_seconds << " s\n"
       << "Throughput:     " << r.requests_per_second << " req/s\n"
       << "\nResponse Time (ms)\n"
       << "  Min:    " << r.min_response_time_ms << "\n"
       << "  Max:    " << r.max_response_time_ms << "\n"
       << "  Mean:   " << r.mean_response_time_ms << "\n"
       << "  Median: " << r.median_response_time_ms << "\n"
       << "  P95:    " << r.p95_response_time_ms << "\n"
       << "  P99:    " << r.p99_response_time_ms << "\n";

    if (r.error_stats.has_value()) {
        ss << "\nErrors\n";
        for (const auto& entry : *r.error_stats) {
            ss << "  " << std::left << std::setw(32) << entry.first << entry.second << "\n";
        }
    }
    return ss.str();
}
