#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief Log-linear latency histogram with bounded relative error.
 *
 * Values (microseconds) are grouped into power-of-two buckets, each split
 * into linear sub-buckets sized so that any recorded value is represented
 * within 10^-significant_digits of itself. Memory depends only on the
 * trackable range and precision, never on how many values are recorded.
 *
 * Not internally synchronized: the owner (ResultAggregator) serializes
 * writers.
 */
class LatencyHistogram {
public:
    static constexpr int64_t kDefaultHighestTrackable = 24LL * 3600 * 1000 * 1000; // 24 hours in us

    explicit LatencyHistogram(int64_t highest_trackable = kDefaultHighestTrackable,
                              int significant_digits = 3);

    // Values above the trackable range are clamped to it, negatives to 0.
    void record(int64_t value);

    // Adds all counts of `other`. Both must share range and precision.
    void merge(const LatencyHistogram& other);

    int64_t count() const { return total_count_; }
    bool empty() const { return total_count_ == 0; }

    // Exact extremes of the recorded values (0 when empty).
    int64_t min() const;
    int64_t max() const;

    // Exact arithmetic mean of the recorded values (0 when empty).
    double mean() const;

    /**
     * @brief Nearest-rank percentile: the smallest bucket boundary v such
     * that at least `percentile`% of recorded values are <= v, clamped into
     * [min(), max()]. Returns 0 when empty.
     */
    int64_t value_at_percentile(double percentile) const;

    int64_t highest_trackable() const { return highest_trackable_; }
    int significant_digits() const { return significant_digits_; }
    size_t counts_length() const { return counts_.size(); }

    int64_t lowest_equivalent_value(int64_t value) const;
    int64_t highest_equivalent_value(int64_t value) const;

private:
    int bucket_index(int64_t value) const;
    int sub_bucket_index(int64_t value, int bucket) const;
    size_t counts_index(int bucket, int sub_bucket) const;
    int64_t value_at_index(size_t index) const;

    int64_t highest_trackable_;
    int significant_digits_;
    int sub_bucket_half_count_magnitude_;
    int64_t sub_bucket_count_;
    int64_t sub_bucket_half_count_;
    int64_t sub_bucket_mask_;
    int bucket_count_;

    std::vector<int64_t> counts_;
    int64_t total_count_ = 0;
    int64_t total_sum_ = 0;
    int64_t min_value_ = 0;
    int64_t max_value_ = 0;
};
