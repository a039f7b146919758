#pragma once

#include <hyperload/RunConfig.hpp>

namespace hyperload::core
{

/// RunConfig의 logLevel/logFilePath를 프로세스 전역 Logger에 반영합니다.
/// - 로그 파일을 열 수 없으면 std::runtime_error
void applyLoggingConfig(const hyperload::RunConfig &cfg);

} // namespace hyperload::core
