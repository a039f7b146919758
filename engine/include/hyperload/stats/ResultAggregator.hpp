#pragma once

#include <hyperload/core/Channel.hpp>
#include <hyperload/stats/LatencyHistogram.hpp>
#include <hyperload/stats/RequestResult.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace hyperload::stats
{

using ResultChannel = core::Channel<RequestResult>;

/// 집계기 단독 소유 상태. 다른 스레드는 접근하지 않는다.
struct AggregateState
{
    LatencyHistogram latencyMs;
    std::map<std::uint16_t, std::uint64_t> statusCounts;
    std::map<std::string, std::uint64_t> errorCounts;
    std::uint64_t successCount{0};
    std::uint64_t failureCount{0};
};

/// 모든 워커 결과의 단일 소비자.
class ResultAggregator
{
  public:
    ResultAggregator();

    ResultAggregator(const ResultAggregator &) = delete;
    ResultAggregator &operator=(const ResultAggregator &) = delete;

    /// 채널이 닫힐 때까지(모든 Sender 반납 + 큐 소진) 결과를 소비한다.
    /// 반환값: 소비한 결과 수
    std::uint64_t drain(ResultChannel::Receiver &rx);

    /// 결과 1건 반영.
    void consume(const RequestResult &result);

    [[nodiscard]] const AggregateState &state() const noexcept { return state_; }
    [[nodiscard]] AggregateState takeState() noexcept { return std::move(state_); }

    /// 히스토그램 기록값: 밀리초 정수, 1ms 미만은 1ms로 올린다.
    [[nodiscard]] static std::uint64_t toHistogramMs(std::chrono::nanoseconds elapsed) noexcept;

  private:
    AggregateState state_;
};

} // namespace hyperload::stats
