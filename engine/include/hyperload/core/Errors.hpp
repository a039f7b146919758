#pragma once

#include <stdexcept>
#include <string>

namespace hyperload::core
{

/// 실행 전에 확정되는 치명적 설정 오류.
/// - 워커 생성/네트워크 활동 이전에 던져지며, 실행 자체를 중단시킨다.
class ConfigurationError : public std::invalid_argument
{
  public:
    explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
};

} // namespace hyperload::core
