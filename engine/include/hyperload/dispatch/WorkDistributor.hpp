#pragma once

#include <hyperload/dispatch/WorkAssignment.hpp>
#include <hyperload/exec/IProtocolExecutor.hpp>
#include <hyperload/stats/ResultAggregator.hpp>

#include <cstddef>
#include <thread>
#include <vector>

namespace hyperload::dispatch
{

/// 작업 분배 결과대로 워커 스레드를 띄우고 join 기록을 모은다.
///
/// - 워커 i는 자기 실행기(factory(i))로 할당량을 순차 실행한다.
/// - 결과는 워커마다 복사한 Sender로 채널에 보낸다. 루프가 끝나면 Sender를 반납한다.
/// - 실행기가 예외를 던지면 그 단위만 "worker task failure: <what>" 실패로 기록하고 계속한다.
/// - 워커 자체가 중단되면(팩토리 실패, 채널 닫힘, 스레드 생성 실패) join 기록에 abnormal로 남는다.
class WorkDistributor
{
  public:
    explicit WorkDistributor(exec::ExecutorFactory factory);
    ~WorkDistributor();

    WorkDistributor(const WorkDistributor &) = delete;
    WorkDistributor &operator=(const WorkDistributor &) = delete;

    /// 워커 시작. tx는 워커 수만큼 복사되고, 이 함수가 끝나면 원본은 반납된다.
    void start(const std::vector<WorkAssignment> &plan, stats::ResultChannel::Sender tx);

    /// 모든 워커를 join하고 워커별 기록을 돌려준다.
    [[nodiscard]] std::vector<WorkerOutcome> joinAll();

    [[nodiscard]] std::size_t workerCount() const noexcept { return outcomes_.size(); }

  private:
    void workerMain_(WorkAssignment assignment, stats::ResultChannel::Sender tx, WorkerOutcome &out);

    exec::ExecutorFactory factory_;
    std::vector<std::thread> threads_;

    // join 전까지 outcomes_[i]는 워커 i만 쓴다
    std::vector<WorkerOutcome> outcomes_;
};

} // namespace hyperload::dispatch
