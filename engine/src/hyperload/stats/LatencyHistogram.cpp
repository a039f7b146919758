#include <hyperload/stats/LatencyHistogram.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace hyperload::stats
{

LatencyHistogram::LatencyHistogram(int significantDigits, std::uint64_t initialHighest)
    : significantDigits_(significantDigits)
{
    if (significantDigits < 1 || significantDigits > 5)
        throw std::invalid_argument("[LatencyHistogram] significantDigits must be in [1, 5]: " +
                                    std::to_string(significantDigits));

    // 한 단위 해상도로 표현해야 하는 가장 큰 값: 2 * 10^digits
    std::uint64_t largestSingleUnit = 2;
    for (int i = 0; i < significantDigits; ++i)
        largestSingleUnit *= 10;

    const int subBucketCountMagnitude = static_cast<int>(std::bit_width(largestSingleUnit - 1));
    subBucketHalfCountMagnitude_ = subBucketCountMagnitude - 1;
    subBucketCount_ = std::uint32_t{1} << subBucketCountMagnitude;
    subBucketHalfCount_ = subBucketCount_ / 2;
    subBucketMask_ = static_cast<std::uint64_t>(subBucketCount_) - 1;

    const std::uint64_t highest = std::clamp<std::uint64_t>(initialHighest, 2 * kLowestValue, kMaxTrackable);
    bucketCount_ = bucketsNeeded_(highest, subBucketCount_);
    highestTrackable_ = (static_cast<std::uint64_t>(subBucketCount_) << (bucketCount_ - 1)) - 1;
    counts_.assign(static_cast<std::size_t>(bucketCount_ + 1) * subBucketHalfCount_, 0);
}

int LatencyHistogram::bucketsNeeded_(std::uint64_t highest, std::uint32_t subBucketCount) noexcept
{
    std::uint64_t smallestUntrackable = subBucketCount;
    int buckets = 1;
    while (smallestUntrackable <= highest)
    {
        if (smallestUntrackable > (std::numeric_limits<std::uint64_t>::max() >> 2))
            return buckets + 1;
        smallestUntrackable <<= 1;
        ++buckets;
    }
    return buckets;
}

bool LatencyHistogram::growTo_(std::uint64_t value) noexcept
{
    if (value > kMaxTrackable)
        return false;

    const int buckets = bucketsNeeded_(value, subBucketCount_);
    if (buckets <= bucketCount_)
        return true;

    // 인덱스 배치는 버킷 수와 무관하므로 뒤에 0을 붙이기만 하면 된다.
    try
    {
        counts_.resize(static_cast<std::size_t>(buckets + 1) * subBucketHalfCount_, 0);
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
    bucketCount_ = buckets;
    highestTrackable_ = (static_cast<std::uint64_t>(subBucketCount_) << (bucketCount_ - 1)) - 1;
    return true;
}

int LatencyHistogram::bucketIndex_(std::uint64_t value) const noexcept
{
    const int leadingZeroCountBase = 64 - subBucketHalfCountMagnitude_ - 1;
    return leadingZeroCountBase - std::countl_zero(value | subBucketMask_);
}

std::uint32_t LatencyHistogram::subBucketIndex_(std::uint64_t value, int bucket) const noexcept
{
    return static_cast<std::uint32_t>(value >> bucket);
}

std::size_t LatencyHistogram::countsIndex_(int bucket, std::uint32_t subBucket) const noexcept
{
    const std::size_t bucketBase = static_cast<std::size_t>(bucket + 1) << subBucketHalfCountMagnitude_;
    return bucketBase + subBucket - subBucketHalfCount_;
}

std::size_t LatencyHistogram::countsIndexFor_(std::uint64_t value) const noexcept
{
    const int bucket = bucketIndex_(value);
    return countsIndex_(bucket, subBucketIndex_(value, bucket));
}

std::uint64_t LatencyHistogram::valueFromIndex_(std::size_t index) const noexcept
{
    int bucket = static_cast<int>(index >> subBucketHalfCountMagnitude_) - 1;
    std::uint64_t subBucket = (index & (subBucketHalfCount_ - 1)) + subBucketHalfCount_;
    if (bucket < 0)
    {
        subBucket -= subBucketHalfCount_;
        bucket = 0;
    }
    return subBucket << bucket;
}

std::uint64_t LatencyHistogram::equivalentRangeSize_(std::uint64_t value) const noexcept
{
    const int bucket = bucketIndex_(value);
    const std::uint32_t subBucket = subBucketIndex_(value, bucket);
    const int adjusted = (subBucket >= subBucketCount_) ? bucket + 1 : bucket;
    return std::uint64_t{1} << adjusted;
}

std::uint64_t LatencyHistogram::lowestEquivalent(std::uint64_t value) const noexcept
{
    const int bucket = bucketIndex_(value);
    return static_cast<std::uint64_t>(subBucketIndex_(value, bucket)) << bucket;
}

std::uint64_t LatencyHistogram::highestEquivalent(std::uint64_t value) const noexcept
{
    return lowestEquivalent(value) + equivalentRangeSize_(value) - 1;
}

std::uint64_t LatencyHistogram::medianEquivalent_(std::uint64_t value) const noexcept
{
    return lowestEquivalent(value) + (equivalentRangeSize_(value) >> 1);
}

bool LatencyHistogram::equivalent(std::uint64_t a, std::uint64_t b) const noexcept
{
    return lowestEquivalent(a) == lowestEquivalent(b);
}

bool LatencyHistogram::record(std::uint64_t value) noexcept
{
    return recordN(value, 1);
}

bool LatencyHistogram::recordN(std::uint64_t value, std::uint64_t count) noexcept
{
    if (value < kLowestValue || count == 0)
        return false;
    if (value > highestTrackable_ && !growTo_(value))
        return false;

    counts_[countsIndexFor_(value)] += count;

    if (totalCount_ == 0)
    {
        minValue_ = value;
        maxValue_ = value;
    }
    else
    {
        minValue_ = std::min(minValue_, value);
        maxValue_ = std::max(maxValue_, value);
    }
    totalCount_ += count;
    return true;
}

void LatencyHistogram::reset() noexcept
{
    std::fill(counts_.begin(), counts_.end(), 0);
    totalCount_ = 0;
    minValue_ = 0;
    maxValue_ = 0;
}

std::uint64_t LatencyHistogram::min() const noexcept
{
    return empty() ? 0 : lowestEquivalent(minValue_);
}

std::uint64_t LatencyHistogram::max() const noexcept
{
    return empty() ? 0 : highestEquivalent(maxValue_);
}

double LatencyHistogram::mean() const noexcept
{
    if (empty())
        return 0.0;

    double total = 0.0;
    for (std::size_t i = 0; i < counts_.size(); ++i)
    {
        if (counts_[i] == 0)
            continue;
        total += static_cast<double>(medianEquivalent_(valueFromIndex_(i))) * static_cast<double>(counts_[i]);
    }
    return total / static_cast<double>(totalCount_);
}

std::uint64_t LatencyHistogram::valueAtPercentile(double percentile) const noexcept
{
    if (empty())
        return 0;

    const double p = std::clamp(percentile, 0.0, 100.0);
    auto target = static_cast<std::uint64_t>(std::ceil((p / 100.0) * static_cast<double>(totalCount_)));
    target = std::clamp<std::uint64_t>(target, 1, totalCount_);

    std::uint64_t running = 0;
    for (std::size_t i = 0; i < counts_.size(); ++i)
    {
        running += counts_[i];
        if (running >= target)
            return std::min(highestEquivalent(valueFromIndex_(i)), max());
    }
    return max();
}

} // namespace hyperload::stats
