#pragma once

#include <hyperload/RunConfig.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace hyperload::core
{

class ConfigLoader
{
  public:
    /// TOML 파일(--config) + 명령행 플래그로 RunConfig를 만든다. 플래그가 파일 값을 덮는다.
    /// - -h/--help: usage를 out에 쓰고 nullopt
    /// - 잘못된 입력은 ConfigurationError
    [[nodiscard]] static std::optional<RunConfig> load(int argc, const char *const *argv,
                                                       std::ostream &out);

    [[nodiscard]] static std::string usage(std::string_view exe);

    /// "trace" .. "fatal" (대소문자 무시, "warning" 허용)
    [[nodiscard]] static LogLevel parseLogLevel(std::string_view s);
};

} // namespace hyperload::core
