#include <hyperload/net/TlsContext.hpp>

#include <hyperload/core/Logger.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/stream_traits.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace hyperload::net
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;

std::shared_ptr<ssl::context> makeClientTlsContext()
{
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                     ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);

    beast::error_code ec;
    ctx->set_default_verify_paths(ec);
    if (ec)
        HLOG_WARN("Tls", "DefaultVerifyPathsFailed", "err='{}'", ec.message());

    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

StepError tlsHandshake(asio::io_context &ioc, TlsStream &stream, const std::string &host, Clock::time_point deadline)
{
    // SNI
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        return StepError{"tls handshake", ec};
    }
    stream.set_verify_callback(ssl::host_name_verification(host));

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_at(deadline);
    stream.async_handshake(ssl::stream_base::client, [&](const beast::error_code &e) { ec = e; });
    runPending(ioc);

    if (ec)
        return StepError{"tls handshake", ec};
    return {};
}

} // namespace hyperload::net
