#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hyperload::dispatch
{

struct WorkAssignment
{
    unsigned int workerIndex{0};
    std::size_t units{0};
};

/// 워커 1개의 join 기록.
/// - reported: 채널로 실제 전달한 결과 수
/// - abnormal: 워커 스레드가 루프를 끝까지 돌지 못하고 예외로 끝났는지
struct WorkerOutcome
{
    unsigned int workerIndex{0};
    std::size_t assigned{0};
    std::size_t reported{0};
    bool abnormal{false};
    std::string reason;

    /// 결과 없이 사라진 작업 단위 수 (비정상 종료 시 최소 1)
    [[nodiscard]] std::size_t unaccounted() const noexcept
    {
        if (!abnormal)
            return 0;
        const std::size_t missing = (assigned > reported) ? assigned - reported : 0;
        return missing == 0 ? 1 : missing;
    }
};

/// N개 작업을 C개 워커에 공평하게 나눈다.
/// - base = N / C, 앞쪽 N % C개 워커가 base + 1을 받는다
/// - 0개를 받는 워커는 결과에서 제외한다 (N < C)
/// - N == 0 또는 C == 0 이면 core::ConfigurationError
[[nodiscard]] std::vector<WorkAssignment> partitionWork(std::size_t totalUnits, std::size_t workers);

} // namespace hyperload::dispatch
