#pragma once

#include <hyperload/RunConfig.hpp>
#include <hyperload/exec/IProtocolExecutor.hpp>
#include <hyperload/net/HttpClient.hpp>
#include <hyperload/protocol/Target.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hyperload::exec
{

/// HTTP 요청 1회 실행기.
/// - 요청 메시지는 생성 시 한 번 만들고 매 호출에 재사용한다.
/// - 메서드/URL 오류는 생성 시 확정되며, 호출마다 네트워크 없이 즉시 실패한다.
class HttpExecutor final : public IProtocolExecutor
{
  public:
    HttpExecutor(std::shared_ptr<net::HttpClient> client, std::size_t lane, const TargetConfig &target,
                 const HttpProtocol &protocol);

    [[nodiscard]] stats::RequestResult execute() override;

    /// "HTTP status: 500 Internal Server Error"
    [[nodiscard]] static std::string describeStatus(std::uint16_t status, std::string_view serverReason);

  private:
    std::shared_ptr<net::HttpClient> client_;
    std::size_t lane_;
    std::chrono::seconds timeout_;

    std::optional<protocol::Target> target_;
    std::string setupError_;
    net::HttpRequest request_;
};

} // namespace hyperload::exec
