#include <hyperload/net/HttpClient.hpp>

#include <hyperload/core/Logger.hpp>
#include <hyperload/net/TlsContext.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <format>
#include <stdexcept>
#include <string_view>

namespace hyperload::net
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

struct HttpClient::Connection
{
    std::string key;
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<TlsStream> tls;
    beast::flat_buffer buffer;

    void close() noexcept
    {
        if (tls)
            beast::get_lowest_layer(*tls).close();
        else if (plain)
            plain->close();
    }

    ~Connection() { close(); }
};

struct HttpClient::Lane
{
    asio::io_context ioc{1};
    std::unique_ptr<Connection> idle;
};

namespace
{

std::string poolKey(const protocol::Target &t)
{
    return std::format("{}://{}:{}", protocol::toString(t.scheme), t.host, t.port);
}

template <typename Stream>
StepError writeAndRead(asio::io_context &ioc, Stream &stream, beast::flat_buffer &buffer, const HttpRequest &request,
                       Clock::time_point deadline, http::response_parser<http::string_body> &parser)
{
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_at(deadline);
    http::async_write(stream, request, [&](const beast::error_code &e, std::size_t) { ec = e; });
    runPending(ioc);
    if (ec)
        return StepError{"write", ec};

    http::async_read(stream, buffer, parser, [&](const beast::error_code &e, std::size_t) { ec = e; });
    runPending(ioc);
    if (ec)
        return StepError{"read", ec};

    return {};
}

/// 풀에서 꺼낸 연결이 서버 쪽에서 이미 닫혀 있을 때 나오는 오류들
bool isStaleConnectionError(const beast::error_code &ec) noexcept
{
    return ec == http::error::end_of_stream || ec == asio::error::eof || ec == asio::error::connection_reset ||
           ec == asio::error::broken_pipe || ec == asio::error::connection_aborted;
}

/// 요청이 서버에 이미 도달했을 수 있는 상태에서 다시 보내도 되는 메서드
bool isIdempotent(http::verb v) noexcept
{
    switch (v)
    {
    case http::verb::get:
    case http::verb::head:
    case http::verb::put:
    case http::verb::delete_:
    case http::verb::options:
        return true;
    default:
        return false;
    }
}

/// 재사용 연결의 실패를 새 연결로 대체해도 되는지.
/// POST/PATCH는 쓰기 단계에서 끊긴 경우만 대체한다. 읽기 단계면 서버가 이미 처리했을 수 있다.
bool canReplaceStale(const StepError &err, bool gotBytes, http::verb method) noexcept
{
    if (gotBytes || err.timedOut() || !isStaleConnectionError(err.ec))
        return false;
    return isIdempotent(method) || std::string_view(err.stage) == "write";
}

} // namespace

HttpClient::HttpClient(std::size_t lanes, std::chrono::seconds timeout, std::shared_ptr<asio::ssl::context> tls)
    : timeout_(timeout), tls_(std::move(tls))
{
    if (lanes == 0)
        throw std::invalid_argument("[HttpClient] lanes must be > 0");
    if (!tls_)
        tls_ = makeClientTlsContext();

    lanes_.reserve(lanes);
    for (std::size_t i = 0; i < lanes; ++i)
        lanes_.push_back(std::make_unique<Lane>());
}

HttpClient::~HttpClient() = default;

std::unique_ptr<HttpClient::Connection> HttpClient::connect_(Lane &lane, const protocol::Target &target,
                                                             Clock::time_point deadline, StepError &err)
{
    auto conn = std::make_unique<Connection>();
    conn->key = poolKey(target);

    if (target.isTls())
    {
        conn->tls = std::make_unique<TlsStream>(lane.ioc, *tls_);
        err = resolveAndConnect(lane.ioc, beast::get_lowest_layer(*conn->tls), target, deadline);
        if (!err.failed())
            err = tlsHandshake(lane.ioc, *conn->tls, target.host, deadline);
    }
    else
    {
        conn->plain = std::make_unique<beast::tcp_stream>(lane.ioc);
        err = resolveAndConnect(lane.ioc, *conn->plain, target, deadline);
    }

    if (err.failed())
        return nullptr;

    connectionsOpened_.fetch_add(1, std::memory_order_relaxed);
    HLOG_DEBUG("HttpClient", "Connected", "key={}", conn->key);
    return conn;
}

StepError HttpClient::exchange_(Lane &lane, Connection &conn, const HttpRequest &request, Clock::time_point deadline,
                                HttpReply &out, bool &keepAlive, bool &gotBytes)
{
    http::response_parser<http::string_body> parser;
    parser.body_limit(boost::none);
    if (request.method() == http::verb::head)
        parser.skip(true);

    StepError err = conn.tls ? writeAndRead(lane.ioc, *conn.tls, conn.buffer, request, deadline, parser)
                             : writeAndRead(lane.ioc, *conn.plain, conn.buffer, request, deadline, parser);

    gotBytes = parser.got_some();
    if (err.failed())
        return err;

    const auto &res = parser.get();
    out.status = static_cast<std::uint16_t>(res.result_int());
    out.reason = std::string(res.reason());
    out.bodyBytes = res.body().size();
    keepAlive = res.keep_alive() && !res.need_eof();
    return {};
}

HttpOutcome HttpClient::send(std::size_t laneIndex, const protocol::Target &target, const HttpRequest &request)
{
    if (laneIndex >= lanes_.size())
        throw std::out_of_range(std::format("[HttpClient] lane {} out of range ({})", laneIndex, lanes_.size()));

    Lane &lane = *lanes_[laneIndex];
    const auto deadline = Clock::now() + timeout_;
    const std::string key = poolKey(target);

    HttpOutcome outcome;

    std::unique_ptr<Connection> conn;
    if (lane.idle && lane.idle->key == key)
        conn = std::move(lane.idle);
    else
        lane.idle.reset();

    const bool reused = (conn != nullptr);
    if (!conn)
    {
        conn = connect_(lane, target, deadline, outcome.error);
        if (!conn)
            return outcome;
    }

    HttpReply reply;
    bool keepAlive = false;
    bool gotBytes = false;
    StepError err = exchange_(lane, *conn, request, deadline, reply, keepAlive, gotBytes);

    if (err.failed() && reused && canReplaceStale(err, gotBytes, request.method()))
    {
        HLOG_DEBUG("HttpClient", "StaleConnection", "key={} stage={} err='{}'", key, err.stage, err.ec.message());
        conn.reset();

        conn = connect_(lane, target, deadline, outcome.error);
        if (!conn)
            return outcome;
        err = exchange_(lane, *conn, request, deadline, reply, keepAlive, gotBytes);
    }

    if (err.failed())
    {
        outcome.error = err;
        return outcome; // conn 소멸 시 닫힘
    }

    if (keepAlive)
        lane.idle = std::move(conn);

    outcome.reply = std::move(reply);
    return outcome;
}

} // namespace hyperload::net
