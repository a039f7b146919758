#pragma once

#include <hyperload/net/Dialer.hpp>
#include <hyperload/protocol/Target.hpp>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hyperload::net
{

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

/// 서버 응답 요약. 본문은 끝까지 읽은 뒤 크기만 남긴다.
struct HttpReply
{
    std::uint16_t status{0};
    std::string reason;
    std::size_t bodyBytes{0};
};

/// 호출 1회의 결과: reply 또는 error 중 하나만 채워진다.
struct HttpOutcome
{
    std::optional<HttpReply> reply;
    StepError error{};
};

/// 모든 워커가 공유하는 HTTP/1.1 클라이언트.
///
/// - 내부 풀은 lane(워커) 단위로 나뉜다. lane i는 워커 i 스레드만 사용한다.
/// - lane마다 io_context 1개, 유휴 keep-alive 연결 최대 1개.
/// - 재사용한 연결이 응답 바이트 전에 끊겨 있으면 새 연결로 한 번 더 보낸다.
///   POST/PATCH는 쓰기 단계 실패일 때만 해당한다.
/// - resolve부터 본문 수신까지 전체가 timeout 하나로 제한된다.
class HttpClient
{
  public:
    HttpClient(std::size_t lanes, std::chrono::seconds timeout,
               std::shared_ptr<boost::asio::ssl::context> tls = nullptr);
    ~HttpClient();

    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    [[nodiscard]] HttpOutcome send(std::size_t lane, const protocol::Target &target, const HttpRequest &request);

    [[nodiscard]] std::size_t laneCount() const noexcept { return lanes_.size(); }
    [[nodiscard]] std::chrono::seconds timeout() const noexcept { return timeout_; }

    /// 지금까지 새로 연 연결 수 (전 lane 합계)
    [[nodiscard]] std::uint64_t connectionsOpened() const noexcept
    {
        return connectionsOpened_.load(std::memory_order_relaxed);
    }

  private:
    struct Connection;
    struct Lane;

    std::unique_ptr<Connection> connect_(Lane &lane, const protocol::Target &target, Clock::time_point deadline,
                                         StepError &err);
    StepError exchange_(Lane &lane, Connection &conn, const HttpRequest &request, Clock::time_point deadline,
                        HttpReply &out, bool &keepAlive, bool &gotBytes);

    std::chrono::seconds timeout_;
    std::shared_ptr<boost::asio::ssl::context> tls_;
    std::vector<std::unique_ptr<Lane>> lanes_;
    std::atomic<std::uint64_t> connectionsOpened_{0};
};

} // namespace hyperload::net
