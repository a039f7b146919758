#include <hyperload/RunConfig.hpp>
#include <hyperload/core/Errors.hpp>

#include <cctype>
#include <string>

namespace hyperload
{

namespace
{
[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = "[RunConfig] " + detail;
    HLOG_ERROR("RunConfig", "ValidationError", "msg={}", msg);
    throw core::ConfigurationError{msg};
}

std::string toUpper(std::string_view s)
{
    std::string out(s);
    for (auto &c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}
} // namespace

ProtocolSelector selectProtocol(std::string_view methodOrWs)
{
    std::string upper = toUpper(methodOrWs);
    if (upper == "WS")
        return WebSocketProtocol{};

    return HttpProtocol{protocol::parseHttpMethod(upper), std::move(upper)};
}

std::string describeProtocol(const ProtocolSelector &protocol)
{
    if (const auto *http = std::get_if<HttpProtocol>(&protocol))
        return http->methodName;
    return "WebSocket";
}

void validateRunConfig(const RunConfig &config)
{
    if (config.totalUnits == 0)
        throwConfigError("total work units (requests) must be >= 1");

    if (config.concurrency == 0)
        throwConfigError("concurrency must be >= 1");

    if (config.target.url.empty())
        throwConfigError("target url must not be empty");

    if (config.target.timeout.count() <= 0)
        throwConfigError("timeout must be >= 1 second");

    if (config.target.wsHold && config.target.wsHold->count() < 0)
        throwConfigError("ws hold duration must not be negative");
}

} // namespace hyperload
