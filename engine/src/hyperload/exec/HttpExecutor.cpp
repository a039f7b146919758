#include <hyperload/exec/HttpExecutor.hpp>

#include <hyperload/core/Defaults.hpp>
#include <hyperload/core/Logger.hpp>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include <format>

namespace hyperload::exec
{

namespace http = boost::beast::http;
using protocol::HttpMethod;

namespace
{

http::verb toVerb(HttpMethod m) noexcept
{
    switch (m)
    {
    case HttpMethod::Get:
        return http::verb::get;
    case HttpMethod::Post:
        return http::verb::post;
    case HttpMethod::Put:
        return http::verb::put;
    case HttpMethod::Delete:
        return http::verb::delete_;
    case HttpMethod::Patch:
        return http::verb::patch;
    case HttpMethod::Head:
        return http::verb::head;
    case HttpMethod::Options:
        return http::verb::options;
    case HttpMethod::Unsupported:
        break;
    }
    return http::verb::unknown;
}

} // namespace

HttpExecutor::HttpExecutor(std::shared_ptr<net::HttpClient> client, std::size_t lane, const TargetConfig &target,
                           const HttpProtocol &protocol)
    : client_(std::move(client)), lane_(lane), timeout_(target.timeout)
{
    if (protocol.method == HttpMethod::Unsupported)
    {
        setupError_ = std::format("unsupported HTTP method: {}", protocol.methodName);
        return;
    }

    std::string why;
    target_ = protocol::parseTarget(target.url, &why);
    if (!target_)
    {
        setupError_ = std::format("invalid url: {}", why);
        return;
    }
    if (target_->isWebSocket())
    {
        setupError_ = std::format("invalid url: scheme '{}' is not http or https", protocol::toString(target_->scheme));
        target_.reset();
        return;
    }

    request_.method(toVerb(protocol.method));
    request_.target(target_->path);
    request_.version(core::defaults::kHttpVersion);
    request_.set(http::field::host, target_->hostHeader());
    request_.set(http::field::user_agent, std::string(core::defaults::kUserAgent));

    // 사용자 헤더가 기본값을 덮는다
    for (const auto &[name, value] : target.headers)
        request_.set(name, value);

    if (target.body)
        request_.body() = *target.body;
    request_.prepare_payload();
}

std::string HttpExecutor::describeStatus(std::uint16_t status, std::string_view serverReason)
{
    const auto known = http::int_to_status(status);
    if (known != http::status::unknown)
        return std::format("HTTP status: {} {}", status, std::string(http::obsolete_reason(known)));
    if (!serverReason.empty())
        return std::format("HTTP status: {} {}", status, serverReason);
    return std::format("HTTP status: {}", status);
}

stats::RequestResult HttpExecutor::execute()
{
    const auto start = net::Clock::now();

    if (!setupError_.empty())
        return stats::RequestResult::failed(net::Clock::now() - start, setupError_);

    net::HttpOutcome out = client_->send(lane_, *target_, request_);
    const auto elapsed = net::Clock::now() - start;

    if (!out.reply)
    {
        HLOG_TRACE("HttpExecutor", "TransportFailure", "stage={} err='{}'", out.error.stage, out.error.ec.message());
        return stats::RequestResult::failed(elapsed, out.error.describe(timeout_));
    }

    const auto status = out.reply->status;
    if (status >= 200 && status < 300)
        return stats::RequestResult::ok(elapsed, status);

    return stats::RequestResult::failed(elapsed, describeStatus(status, out.reply->reason), status);
}

} // namespace hyperload::exec
