#pragma once

#include <hyperload/RunConfig.hpp>
#include <hyperload/exec/IProtocolExecutor.hpp>
#include <hyperload/net/Dialer.hpp>
#include <hyperload/protocol/Target.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace hyperload::exec
{

/// WebSocket 세션 1회 실행기.
/// 연결 -> (선택) 텍스트 프레임 1개 전송 -> (선택) hold 동안 대기 -> 정상 종료.
/// 수신 루프는 없다. 세션 하나가 결과 하나다.
class WebSocketExecutor final : public IProtocolExecutor
{
  public:
    WebSocketExecutor(const TargetConfig &target, std::shared_ptr<boost::asio::ssl::context> tls);

    [[nodiscard]] stats::RequestResult execute() override;

  private:
    template <typename Ws>
    stats::RequestResult runSession_(Ws &ws, net::Clock::time_point start, net::Clock::time_point deadline);

    boost::asio::io_context ioc_{1};
    std::shared_ptr<boost::asio::ssl::context> tls_;
    std::chrono::seconds timeout_;

    std::optional<protocol::Target> target_;
    std::string setupError_;
    std::optional<std::string> message_;
    std::optional<std::chrono::seconds> hold_;
};

} // namespace hyperload::exec
