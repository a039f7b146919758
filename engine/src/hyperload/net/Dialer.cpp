#include <hyperload/net/Dialer.hpp>

#include <hyperload/core/Logger.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>

#include <format>

namespace hyperload::net
{

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

bool StepError::timedOut() const noexcept
{
    return ec == beast::error::timeout;
}

std::string StepError::describe(std::chrono::seconds timeout) const
{
    if (!failed())
        return {};
    if (timedOut())
        return std::format("timeout: no response within {}s (stage={})", timeout.count(), stage);
    return std::format("{}: {}", stage, ec.message());
}

void runPending(asio::io_context &ioc)
{
    ioc.restart();
    ioc.run();
}

StepError resolveAndConnect(asio::io_context &ioc, beast::tcp_stream &stream, const protocol::Target &target,
                            Clock::time_point deadline)
{
    // resolver에는 자체 타임아웃이 없으므로 타이머로 취소한다.
    tcp::resolver resolver(ioc);
    asio::steady_timer guard(ioc);
    bool expired = false;

    beast::error_code ec;
    tcp::resolver::results_type endpoints;

    guard.expires_at(deadline);
    guard.async_wait([&](const beast::error_code &e) {
        if (!e)
        {
            expired = true;
            resolver.cancel();
        }
    });
    resolver.async_resolve(target.host, target.portString(),
                           [&](const beast::error_code &e, tcp::resolver::results_type results) {
                               ec = e;
                               endpoints = std::move(results);
                               guard.cancel();
                           });
    runPending(ioc);

    if (expired && ec)
        return StepError{"resolve", beast::error::timeout};
    if (ec)
        return StepError{"resolve", ec};

    HLOG_TRACE("Dialer", "Resolved", "host={} port={} endpoints={}", target.host, target.port, endpoints.size());

    stream.expires_at(deadline);
    stream.async_connect(endpoints, [&](const beast::error_code &e, const tcp::endpoint &) { ec = e; });
    runPending(ioc);

    if (ec)
        return StepError{"connect", ec};

    stream.socket().set_option(tcp::no_delay(true), ec);
    if (ec)
        HLOG_DEBUG("Dialer", "NoDelayFailed", "host={} err='{}'", target.host, ec.message());

    return {};
}

} // namespace hyperload::net
