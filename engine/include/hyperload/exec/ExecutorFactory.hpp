#pragma once

#include <hyperload/RunConfig.hpp>
#include <hyperload/exec/IProtocolExecutor.hpp>

#include <cstddef>

namespace hyperload::exec
{

/// 설정의 프로토콜 선택에 맞는 실행기 팩토리를 만든다.
/// - HTTP: HttpClient 1개(워커 수만큼 lane)를 모든 실행기가 공유한다.
/// - WebSocket: TLS 컨텍스트만 공유하고 세션마다 새 연결을 연다.
[[nodiscard]] ExecutorFactory makeExecutorFactory(const TargetConfig &target, std::size_t workers);

} // namespace hyperload::exec
