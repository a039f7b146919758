#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hyperload::stats
{

/// HDR 방식(log-linear 버킷) 정수 히스토그램.
///
/// - 값 영역: [1, 2^62). 0은 기록하지 않는다 (record()가 false 반환)
/// - significantDigits 자리의 상대 정밀도를 보장한다. (기본 3자리 -> 0.1% 이내)
/// - 상한은 기록 시 필요한 만큼 자동으로 늘어난다.
/// - 스레드 안전하지 않다. 단일 소유자(ResultAggregator)만 기록한다.
class LatencyHistogram
{
  public:
    static constexpr std::uint64_t kLowestValue = 1;
    static constexpr std::uint64_t kMaxTrackable = (std::uint64_t{1} << 62) - 1;

    explicit LatencyHistogram(int significantDigits = 3, std::uint64_t initialHighest = 60'000);

    /// 값 1개 기록. 영역 밖이면 false.
    [[nodiscard]] bool record(std::uint64_t value) noexcept;

    /// 같은 값을 count번 기록한 것과 같다.
    [[nodiscard]] bool recordN(std::uint64_t value, std::uint64_t count) noexcept;

    void reset() noexcept;

    [[nodiscard]] std::uint64_t totalCount() const noexcept { return totalCount_; }
    [[nodiscard]] bool empty() const noexcept { return totalCount_ == 0; }

    /// 아래 조회 함수들은 empty()면 0을 반환한다.
    [[nodiscard]] std::uint64_t min() const noexcept;
    [[nodiscard]] std::uint64_t max() const noexcept;
    [[nodiscard]] double mean() const noexcept;

    /// percentile: [0, 100]. 범위 밖은 잘라서 해석한다.
    [[nodiscard]] std::uint64_t valueAtPercentile(double percentile) const noexcept;

    [[nodiscard]] int significantDigits() const noexcept { return significantDigits_; }
    [[nodiscard]] std::uint64_t highestTrackable() const noexcept { return highestTrackable_; }

    /// 두 값이 같은 버킷(구분 불가 범위)에 속하는지
    [[nodiscard]] bool equivalent(std::uint64_t a, std::uint64_t b) const noexcept;
    [[nodiscard]] std::uint64_t lowestEquivalent(std::uint64_t value) const noexcept;
    [[nodiscard]] std::uint64_t highestEquivalent(std::uint64_t value) const noexcept;

  private:
    [[nodiscard]] int bucketIndex_(std::uint64_t value) const noexcept;
    [[nodiscard]] std::uint32_t subBucketIndex_(std::uint64_t value, int bucket) const noexcept;
    [[nodiscard]] std::size_t countsIndex_(int bucket, std::uint32_t subBucket) const noexcept;
    [[nodiscard]] std::size_t countsIndexFor_(std::uint64_t value) const noexcept;
    [[nodiscard]] std::uint64_t valueFromIndex_(std::size_t index) const noexcept;
    [[nodiscard]] std::uint64_t equivalentRangeSize_(std::uint64_t value) const noexcept;
    [[nodiscard]] std::uint64_t medianEquivalent_(std::uint64_t value) const noexcept;

    bool growTo_(std::uint64_t value) noexcept;
    static int bucketsNeeded_(std::uint64_t highest, std::uint32_t subBucketCount) noexcept;

    int significantDigits_{3};
    std::uint32_t subBucketCount_{0};
    std::uint32_t subBucketHalfCount_{0};
    int subBucketHalfCountMagnitude_{0};
    std::uint64_t subBucketMask_{0};
    int bucketCount_{0};
    std::uint64_t highestTrackable_{0};

    std::vector<std::uint64_t> counts_;
    std::uint64_t totalCount_{0};
    std::uint64_t minValue_{0};
    std::uint64_t maxValue_{0};
};

} // namespace hyperload::stats
