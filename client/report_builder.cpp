#include "report_builder.hpp"

#include <algorithm>

namespace {

double micros_to_ms(long long micros)
{
    return static_cast<double>(micros) / 1000.0;
}

} // namespace

LoadTestReport build_report(const std::string& id, const AggregateSnapshot& snapshot,
                            std::chrono::steady_clock::duration elapsed)
{
    LoadTestReport report;
    report.id = id;
    report.status = "completed";
    report.total_requests = snapshot.total();
    report.successful_requests = snapshot.successful;
    report.failed_requests = snapshot.failed;

    report.total_duration_seconds =
        std::max(kMinRunDurationSeconds, std::chrono::duration<double>(elapsed).count());
    report.requests_per_second =
        static_cast<double>(report.total_requests) / report.total_duration_seconds;

    const LatencyHistogram& h = snapshot.latencies;
    if (snapshot.successful > 0) {
        report.min_response_time_ms = micros_to_ms(h.min());
        report.max_response_time_ms = micros_to_ms(h.max());
        report.mean_response_time_ms = h.mean() / 1000.0;
        report.median_response_time_ms = micros_to_ms(h.value_at_percentile(50.0));
        report.p95_response_time_ms = micros_to_ms(h.value_at_percentile(95.0));
        report.p99_response_time_ms = micros_to_ms(h.value_at_percentile(99.0));
    }

    if (snapshot.failed > 0) {
        report.error_stats = snapshot.error_counts;
    }
    return report;
}

LoadTestReport build_failed_report(const std::string& id)
{
    LoadTestReport report;
    report.id = id;
    report.status = "failed";
    return report;
}
