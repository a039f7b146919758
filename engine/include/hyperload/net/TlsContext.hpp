#pragma once

#include <hyperload/net/Dialer.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <memory>
#include <string>

namespace hyperload::net
{

using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

/// 클라이언트용 TLS 컨텍스트 (TLS 1.2+, 시스템 CA로 피어 검증).
/// 모든 워커가 공유한다.
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> makeClientTlsContext();

/// SNI/호스트명 검증을 설정하고 TLS 핸드셰이크를 수행한다.
[[nodiscard]] StepError tlsHandshake(boost::asio::io_context &ioc, TlsStream &stream, const std::string &host,
                                     Clock::time_point deadline);

} // namespace hyperload::net
