#include <gtest/gtest.h>

#include <chrono>

#include "report_builder.hpp"
#include "utils.h"

using namespace std::chrono_literals;

class ReportBuilderTest : public ::testing::Test {
protected:
    ResultAggregator agg;

    void add_successes(std::initializer_list<long long> millis) {
        for (long long ms : millis) {
            agg.fold(SuccessOutcome{std::chrono::milliseconds(ms)});
        }
    }
};

TEST_F(ReportBuilderTest, CompletedReportFields) {
    add_successes({100, 200, 300});
    agg.fold(FailureOutcome{FailureKind::HttpStatus, 404, 5000us});

    LoadTestReport r = build_report("run-1", agg.snapshot(), 2s);

    EXPECT_EQ(r.id, "run-1");
    EXPECT_EQ(r.status, "completed");
    EXPECT_EQ(r.total_requests, 4);
    EXPECT_EQ(r.successful_requests, 3);
    EXPECT_EQ(r.failed_requests, 1);
    EXPECT_DOUBLE_EQ(r.total_duration_seconds, 2.0);
    EXPECT_DOUBLE_EQ(r.requests_per_second, 2.0);

    EXPECT_NEAR(r.min_response_time_ms, 100.0, 0.1);
    EXPECT_NEAR(r.max_response_time_ms, 300.0, 0.3);
    EXPECT_DOUBLE_EQ(r.mean_response_time_ms, 200.0);
    EXPECT_NEAR(r.median_response_time_ms, 200.0, 0.2);

    ASSERT_TRUE(r.error_stats.has_value());
    EXPECT_EQ(r.error_stats->at("404_not_found"), 1);
}

TEST_F(ReportBuilderTest, PercentilesAreOrdered) {
    for (long long ms = 1; ms <= 500; ++ms) {
        agg.fold(SuccessOutcome{std::chrono::microseconds(ms * 997)});
    }
    LoadTestReport r = build_report("run-2", agg.snapshot(), 1s);

    EXPECT_LE(r.min_response_time_ms, r.median_response_time_ms);
    EXPECT_LE(r.median_response_time_ms, r.p95_response_time_ms);
    EXPECT_LE(r.p95_response_time_ms, r.p99_response_time_ms);
    EXPECT_LE(r.p99_response_time_ms, r.max_response_time_ms);
    EXPECT_NEAR(r.p95_response_time_ms, 475 * 0.997, 0.5);
    EXPECT_NEAR(r.p99_response_time_ms, 495 * 0.997, 0.5);
}

TEST_F(ReportBuilderTest, AllFailuresUseZeroLatencies) {
    for (int i = 0; i < 5; ++i) {
        agg.fold(FailureOutcome{FailureKind::Timeout, 0, 200ms});
    }
    LoadTestReport r = build_report("run-3", agg.snapshot(), 1s);

    EXPECT_EQ(r.successful_requests, 0);
    EXPECT_EQ(r.failed_requests, 5);
    EXPECT_EQ(r.min_response_time_ms, 0.0);
    EXPECT_EQ(r.max_response_time_ms, 0.0);
    EXPECT_EQ(r.mean_response_time_ms, 0.0);
    EXPECT_EQ(r.median_response_time_ms, 0.0);
    EXPECT_EQ(r.p95_response_time_ms, 0.0);
    EXPECT_EQ(r.p99_response_time_ms, 0.0);
    ASSERT_TRUE(r.error_stats.has_value());
    EXPECT_EQ(r.error_stats->at("timeout"), 5);
}

TEST_F(ReportBuilderTest, NoFailuresMeansNullErrorStats) {
    add_successes({10, 10, 10});
    LoadTestReport r = build_report("run-4", agg.snapshot(), 1s);

    EXPECT_FALSE(r.error_stats.has_value());
    EXPECT_TRUE(report_to_json(r)["error_stats"].is_null());
}

TEST_F(ReportBuilderTest, ZeroDurationIsFloored) {
    add_successes({0});
    LoadTestReport r = build_report("run-5", agg.snapshot(), std::chrono::nanoseconds(0));

    EXPECT_GT(r.total_duration_seconds, 0.0);
    EXPECT_DOUBLE_EQ(r.total_duration_seconds, kMinRunDurationSeconds);
    EXPECT_DOUBLE_EQ(r.requests_per_second, 1.0 / kMinRunDurationSeconds);
}

TEST(FailedReportTest, NeverStartedRun) {
    LoadTestReport r = build_failed_report("run-6");
    EXPECT_EQ(r.status, "failed");
    EXPECT_EQ(r.total_requests, 0);
    EXPECT_EQ(r.successful_requests + r.failed_requests, r.total_requests);
    EXPECT_FALSE(r.error_stats.has_value());
}

TEST(ReportJsonTest, ContainsExactlyTheReportFields) {
    LoadTestReport r;
    r.id = "abc";
    r.status = "completed";
    r.total_requests = 10;
    r.successful_requests = 8;
    r.failed_requests = 2;
    r.error_stats = std::map<std::string, long long>{{"500_internal_server_error", 2}};

    nlohmann::json j = report_to_json(r);
    const char* fields[] = {
        "id", "status", "total_requests", "successful_requests", "failed_requests",
        "requests_per_second", "min_response_time_ms", "max_response_time_ms",
        "mean_response_time_ms", "median_response_time_ms", "p95_response_time_ms",
        "p99_response_time_ms", "total_duration_seconds", "error_stats"};
    for (const char* f : fields) {
        EXPECT_TRUE(j.contains(f)) << f;
    }
    EXPECT_EQ(j.size(), sizeof(fields) / sizeof(fields[0]));
    EXPECT_EQ(j["error_stats"]["500_internal_server_error"], 2);
    EXPECT_EQ(j["total_requests"], 10);
}

TEST(ReportTextTest, ListsErrors) {
    LoadTestReport r;
    r.id = "abc";
    r.status = "completed";
    r.error_stats = std::map<std::string, long long>{{"timeout", 3}};

    std::string text = format_report_text(r);
    EXPECT_NE(text.find("Total Requests: 0"), std::string::npos);
    EXPECT_NE(text.find("timeout"), std::string::npos);
}

TEST(RunIdTest, LooksLikeUuidV4) {
    std::string a = generate_run_id();
    std::string b = generate_run_id();
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[13], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_EQ(a[18], '-');
    EXPECT_NE(std::string("89ab").find(a[19]), std::string::npos);
    EXPECT_EQ(a[23], '-');
    EXPECT_NE(a, b);
}
