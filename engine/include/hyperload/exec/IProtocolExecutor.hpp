#pragma once

#include <hyperload/stats/RequestResult.hpp>

#include <functional>
#include <memory>

namespace hyperload::exec
{

/// 작업 단위 1건(HTTP 호출 1회 / WebSocket 세션 1회)을 수행한다.
/// - 실행기 1개는 워커 1개가 단독으로 쓴다 (스레드 간 공유 금지)
/// - 단위별 실패는 결과로 돌려준다. 예외가 나오면 워커가 실패 결과로 바꿔 기록한다.
class IProtocolExecutor
{
  public:
    virtual ~IProtocolExecutor() = default;

    [[nodiscard]] virtual stats::RequestResult execute() = 0;
};

/// 워커 인덱스 -> 그 워커 전용 실행기
using ExecutorFactory = std::function<std::unique_ptr<IProtocolExecutor>(unsigned int workerIndex)>;

} // namespace hyperload::exec
