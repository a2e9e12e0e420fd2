#include "latency_histogram.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

// Number of significant bits, 0 for 0.
int bit_length(uint64_t value)
{
    int bits = 0;
    while (value != 0) {
        value >>= 1;
        ++bits;
    }
    return bits;
}

} // namespace

LatencyHistogram::LatencyHistogram(int64_t highest_trackable, int significant_digits)
    : highest_trackable_(highest_trackable), significant_digits_(significant_digits)
{
    if (significant_digits < 1 || significant_digits > 5) {
        throw std::invalid_argument("significant_digits must be between 1 and 5");
    }
    if (highest_trackable < 2) {
        throw std::invalid_argument("highest_trackable must be at least 2");
    }

    // Smallest power of two that still resolves single units at 10^digits.
    int64_t largest_single_unit_resolution = 2;
    for (int i = 0; i < significant_digits; ++i) largest_single_unit_resolution *= 10;

    int sub_bucket_count_magnitude = 0;
    while ((int64_t{1} << sub_bucket_count_magnitude) < largest_single_unit_resolution) {
        ++sub_bucket_count_magnitude;
    }
    sub_bucket_half_count_magnitude_ = std::max(sub_bucket_count_magnitude, 1) - 1;
    sub_bucket_count_ = int64_t{1} << (sub_bucket_half_count_magnitude_ + 1);
    sub_bucket_half_count_ = sub_bucket_count_ / 2;
    sub_bucket_mask_ = sub_bucket_count_ - 1;

    int64_t smallest_untrackable = sub_bucket_count_;
    bucket_count_ = 1;
    while (smallest_untrackable <= highest_trackable_) {
        if (smallest_untrackable > std::numeric_limits<int64_t>::max() / 2) {
            ++bucket_count_;
            break;
        }
        smallest_untrackable <<= 1;
        ++bucket_count_;
    }

    counts_.assign(static_cast<size_t>((bucket_count_ + 1) * sub_bucket_half_count_), 0);
}

int LatencyHistogram::bucket_index(int64_t value) const
{
    int pow2_ceiling = bit_length(static_cast<uint64_t>(value | sub_bucket_mask_));
    return pow2_ceiling - (sub_bucket_half_count_magnitude_ + 1);
}

int LatencyHistogram::sub_bucket_index(int64_t value, int bucket) const
{
    return static_cast<int>(value >> bucket);
}

size_t LatencyHistogram::counts_index(int bucket, int sub_bucket) const
{
    int64_t bucket_base = static_cast<int64_t>(bucket + 1) << sub_bucket_half_count_magnitude_;
    return static_cast<size_t>(bucket_base + (sub_bucket - sub_bucket_half_count_));
}

int64_t LatencyHistogram::value_at_index(size_t index) const
{
    int bucket = static_cast<int>(index >> sub_bucket_half_count_magnitude_) - 1;
    int64_t sub_bucket = static_cast<int64_t>(index & static_cast<size_t>(sub_bucket_half_count_ - 1))
                         + sub_bucket_half_count_;
    if (bucket < 0) {
        sub_bucket -= sub_bucket_half_count_;
        bucket = 0;
    }
    return sub_bucket << bucket;
}

int64_t LatencyHistogram::lowest_equivalent_value(int64_t value) const
{
    int bucket = bucket_index(value);
    int sub_bucket = sub_bucket_index(value, bucket);
    return static_cast<int64_t>(sub_bucket) << bucket;
}

int64_t LatencyHistogram::highest_equivalent_value(int64_t value) const
{
    int bucket = bucket_index(value);
    return lowest_equivalent_value(value) + (int64_t{1} << bucket) - 1;
}

void LatencyHistogram::record(int64_t value)
{
    value = std::clamp<int64_t>(value, 0, highest_trackable_);

    int bucket = bucket_index(value);
    counts_[counts_index(bucket, sub_bucket_index(value, bucket))]++;

    if (total_count_ == 0) {
        min_value_ = value;
        max_value_ = value;
    } else {
        min_value_ = std::min(min_value_, value);
        max_value_ = std::max(max_value_, value);
    }
    ++total_count_;
    total_sum_ += value;
}

void LatencyHistogram::merge(const LatencyHistogram& other)
{
    if (other.counts_.size() != counts_.size() ||
        other.sub_bucket_count_ != sub_bucket_count_) {
        throw std::invalid_argument("cannot merge histograms with different layouts");
    }
    if (other.total_count_ == 0) return;

    for (size_t i = 0; i < counts_.size(); ++i) {
        counts_[i] += other.counts_[i];
    }
    if (total_count_ == 0) {
        min_value_ = other.min_value_;
        max_value_ = other.max_value_;
    } else {
        min_value_ = std::min(min_value_, other.min_value_);
        max_value_ = std::max(max_value_, other.max_value_);
    }
    total_count_ += other.total_count_;
    total_sum_ += other.total_sum_;
}

int64_t LatencyHistogram::min() const
{
    return total_count_ == 0 ? 0 : min_value_;
}

int64_t LatencyHistogram::max() const
{
    return total_count_ == 0 ? 0 : max_value_;
}

double LatencyHistogram::mean() const
{
    if (total_count_ == 0) return 0.0;
    return static_cast<double>(total_sum_) / static_cast<double>(total_count_);
}

int64_t LatencyHistogram::value_at_percentile(double percentile) const
{
    if (total_count_ == 0) return 0;

    percentile = std::clamp(percentile, 0.0, 100.0);
    // Rank of the value we are looking for (1-based, nearest-rank).
    double exact_rank = percentile / 100.0 * static_cast<double>(total_count_);
    int64_t rank = static_cast<int64_t>(std::ceil(exact_rank - 1e-9));
    rank = std::clamp<int64_t>(rank, 1, total_count_);

    int64_t running = 0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        running += counts_[i];
        if (running >= rank) {
            int64_t value = highest_equivalent_value(value_at_index(i));
            return std::clamp(value, min_value_, max_value_);
        }
    }
    return max_value_;
}
