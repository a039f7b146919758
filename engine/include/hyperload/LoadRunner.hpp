#pragma once

#include <hyperload/RunConfig.hpp>
#include <hyperload/exec/IProtocolExecutor.hpp>
#include <hyperload/stats/Summary.hpp>

namespace hyperload
{

/// 실행 1회를 처음부터 끝까지 진행한다.
///
/// 검증 -> 작업 분배 -> 워커 시작 -> 호출 스레드에서 집계 -> join -> 요약.
/// - 설정 오류는 워커/네트워크 활동 전에 core::ConfigurationError로 던진다.
/// - factory를 비워두면 설정의 프로토콜에 맞는 기본 실행기를 쓴다.
class LoadRunner
{
  public:
    explicit LoadRunner(RunConfig config, exec::ExecutorFactory factory = {});

    [[nodiscard]] stats::Summary run();

    [[nodiscard]] const RunConfig &config() const noexcept { return config_; }

  private:
    RunConfig config_;
    exec::ExecutorFactory factory_;
};

} // namespace hyperload
