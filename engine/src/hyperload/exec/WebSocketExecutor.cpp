#include <hyperload/exec/WebSocketExecutor.hpp>

#include <hyperload/core/Defaults.hpp>
#include <hyperload/core/Logger.hpp>
#include <hyperload/net/TlsContext.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <format>
#include <thread>

namespace hyperload::exec
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

using net::Clock;
using net::StepError;

namespace
{

stats::RequestResult connectFailed(Clock::time_point start, const StepError &err, std::chrono::seconds timeout)
{
    return stats::RequestResult::failed(Clock::now() - start,
                                        std::format("WebSocket connect failed: {}", err.describe(timeout)));
}

} // namespace

WebSocketExecutor::WebSocketExecutor(const TargetConfig &target, std::shared_ptr<asio::ssl::context> tls)
    : tls_(std::move(tls)), timeout_(target.timeout), message_(target.wsMessage), hold_(target.wsHold)
{
    std::string why;
    target_ = protocol::parseTarget(target.url, &why);
    if (!target_)
    {
        setupError_ = std::format("invalid url: {}", why);
        return;
    }
    if (!target_->isWebSocket())
    {
        setupError_ = std::format("invalid url: scheme '{}' is not ws or wss", protocol::toString(target_->scheme));
        target_.reset();
        return;
    }
    if (target_->isTls() && !tls_)
        tls_ = net::makeClientTlsContext();
}

stats::RequestResult WebSocketExecutor::execute()
{
    const auto start = Clock::now();

    if (!setupError_.empty())
        return stats::RequestResult::failed(Clock::now() - start, setupError_);

    const auto deadline = start + timeout_;

    if (target_->isTls())
    {
        websocket::stream<net::TlsStream> ws(ioc_, *tls_);

        StepError err = net::resolveAndConnect(ioc_, beast::get_lowest_layer(ws), *target_, deadline);
        if (!err.failed())
            err = net::tlsHandshake(ioc_, ws.next_layer(), target_->host, deadline);
        if (err.failed())
            return connectFailed(start, err, timeout_);

        return runSession_(ws, start, deadline);
    }

    websocket::stream<beast::tcp_stream> ws(ioc_);

    const StepError err = net::resolveAndConnect(ioc_, beast::get_lowest_layer(ws), *target_, deadline);
    if (err.failed())
        return connectFailed(start, err, timeout_);

    return runSession_(ws, start, deadline);
}

template <typename Ws>
stats::RequestResult WebSocketExecutor::runSession_(Ws &ws, Clock::time_point start, Clock::time_point deadline)
{
    beast::error_code ec;

    // 핸드셰이크 이후의 타임아웃은 websocket 옵션이 관리한다
    beast::get_lowest_layer(ws).expires_never();

    const auto remaining = deadline - Clock::now();
    if (remaining <= Clock::duration::zero())
        return connectFailed(start, StepError{"handshake", beast::error::timeout}, timeout_);

    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::duration_cast<websocket::stream_base::duration>(remaining);
    opt.idle_timeout = websocket::stream_base::none();
    opt.keep_alive_pings = false;
    ws.set_option(opt);

    ws.set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
        req.set(http::field::user_agent, std::string(core::defaults::kUserAgent));
    }));

    ws.async_handshake(target_->hostHeader(), target_->path, [&](const beast::error_code &e) { ec = e; });
    net::runPending(ioc_);
    if (ec)
        return connectFailed(start, StepError{"handshake", ec}, timeout_);

    if (message_)
    {
        ws.text(true);
        ws.async_write(asio::buffer(*message_), [&](const beast::error_code &e, std::size_t) { ec = e; });
        net::runPending(ioc_);
        if (ec)
        {
            const auto elapsed = Clock::now() - start;
            beast::get_lowest_layer(ws).close();
            return stats::RequestResult::failed(elapsed, std::format("WebSocket send failed: {}", ec.message()));
        }
    }

    std::chrono::nanoseconds elapsed{0};
    if (hold_)
    {
        std::this_thread::sleep_for(*hold_);
        elapsed = Clock::now() - start;
    }

    // 종료 핸드셰이크에도 타임아웃을 건다
    opt.handshake_timeout = std::chrono::duration_cast<websocket::stream_base::duration>(timeout_);
    ws.set_option(opt);

    ws.async_close(websocket::close_code::normal, [&](const beast::error_code &e) { ec = e; });
    net::runPending(ioc_);
    if (ec)
    {
        HLOG_DEBUG("WebSocket", "CloseFailed", "host={} err='{}'", target_->host, ec.message());
        beast::get_lowest_layer(ws).close();
    }

    if (!hold_)
        elapsed = Clock::now() - start;

    return stats::RequestResult::ok(elapsed);
}

} // namespace hyperload::exec
