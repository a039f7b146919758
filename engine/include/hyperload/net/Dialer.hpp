#pragma once

#include <hyperload/protocol/Target.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <string>

namespace hyperload::net
{

using Clock = std::chrono::steady_clock;

/// 네트워크 단계 하나의 실패 정보. stage == nullptr 이면 성공.
struct StepError
{
    const char *stage{nullptr};
    boost::beast::error_code ec{};

    [[nodiscard]] bool failed() const noexcept { return stage != nullptr; }
    [[nodiscard]] bool timedOut() const noexcept;

    /// "connect: Connection refused" / "timeout: no response within 30s (stage=connect)"
    [[nodiscard]] std::string describe(std::chrono::seconds timeout) const;
};

/// 현재 스레드에서 io_context의 대기 핸들러를 모두 소진한다.
/// 워커는 자기 lane의 io_context만 돌리므로 다른 워커와 간섭이 없다.
void runPending(boost::asio::io_context &ioc);

/// 이름 해석 + TCP 연결. 두 단계 모두 deadline을 넘기면 timeout.
[[nodiscard]] StepError resolveAndConnect(boost::asio::io_context &ioc, boost::beast::tcp_stream &stream,
                                          const protocol::Target &target, Clock::time_point deadline);

} // namespace hyperload::net
