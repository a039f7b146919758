#pragma once

#include <hyperload/dispatch/WorkAssignment.hpp>
#include <hyperload/stats/ResultAggregator.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hyperload::stats
{

/// 성공 요청 지연 통계 (ms)
struct LatencySummary
{
    double meanMs{0.0};
    std::uint64_t minMs{0};
    std::uint64_t maxMs{0};
    std::uint64_t p50Ms{0};
    std::uint64_t p90Ms{0};
    std::uint64_t p95Ms{0};
    std::uint64_t p99Ms{0};
};

/// 실행 최종 결과. 생성 후 읽기 전용.
struct Summary
{
    std::chrono::nanoseconds elapsed{0};
    std::uint64_t totalExecuted{0};
    std::uint64_t successCount{0};
    std::uint64_t failureCount{0};

    /// elapsed == 0 이면 nullopt
    std::optional<double> rps;

    /// 성공 건이 없으면 nullopt
    std::optional<LatencySummary> latency;

    /// 상태 코드 오름차순
    std::vector<std::pair<std::uint16_t, std::uint64_t>> statusCodes;

    /// 오류 메시지 오름차순
    std::vector<std::pair<std::string, std::uint64_t>> errors;

    /// 비정상 종료한 워커 수
    std::size_t abnormalWorkers{0};

    [[nodiscard]] double elapsedSeconds() const noexcept
    {
        return std::chrono::duration<double>(elapsed).count();
    }
};

class SummaryBuilder
{
  public:
    /// 워커 join 기록을 실패 건수에 합친 뒤 파생 지표를 계산한다.
    /// state는 복사해서 쓰지 않는다: 비정상 종료 보정이 state에 직접 반영된다.
    [[nodiscard]] static Summary build(AggregateState &state,
                                       const std::vector<dispatch::WorkerOutcome> &outcomes,
                                       std::chrono::nanoseconds elapsed);

    /// 비정상 종료 워커의 미보고 작업 단위를 실패로 합친다. 반환값: 추가된 실패 수
    static std::uint64_t foldWorkerFailures(AggregateState &state,
                                            const std::vector<dispatch::WorkerOutcome> &outcomes);
};

} // namespace hyperload::stats
