#include <hyperload/exec/ExecutorFactory.hpp>

#include <hyperload/core/Logger.hpp>
#include <hyperload/exec/HttpExecutor.hpp>
#include <hyperload/exec/WebSocketExecutor.hpp>
#include <hyperload/net/HttpClient.hpp>
#include <hyperload/net/TlsContext.hpp>

#include <memory>
#include <variant>

namespace hyperload::exec
{

ExecutorFactory makeExecutorFactory(const TargetConfig &target, std::size_t workers)
{
    // 팩토리는 워커 스레드에서 호출된다. 공유 상태는 읽기 전용으로만 캡처한다.
    auto cfg = std::make_shared<const TargetConfig>(target);
    auto tls = net::makeClientTlsContext();

    if (const auto *httpProto = std::get_if<HttpProtocol>(&cfg->protocol))
    {
        auto client = std::make_shared<net::HttpClient>(workers == 0 ? 1 : workers, cfg->timeout, tls);
        HLOG_DEBUG("Executor", "HttpFactory", "method={} lanes={} timeout={}s", httpProto->methodName,
                   client->laneCount(), cfg->timeout.count());

        return [cfg, client, proto = *httpProto](unsigned int workerIndex) -> std::unique_ptr<IProtocolExecutor> {
            return std::make_unique<HttpExecutor>(client, workerIndex, *cfg, proto);
        };
    }

    HLOG_DEBUG("Executor", "WebSocketFactory", "timeout={}s hold={}", cfg->timeout.count(),
               cfg->wsHold ? cfg->wsHold->count() : 0);

    return [cfg, tls](unsigned int) -> std::unique_ptr<IProtocolExecutor> {
        return std::make_unique<WebSocketExecutor>(*cfg, tls);
    };
}

} // namespace hyperload::exec
