#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hyperload::protocol
{

enum class Scheme : std::uint8_t
{
    Http,
    Https,
    Ws,
    Wss
};

/// 파싱된 대상 URL.
/// - host는 IPv6 리터럴이면 대괄호를 벗긴 형태로 저장한다 (resolver 입력용)
/// - path는 항상 '/'로 시작하며 query를 포함한다. fragment는 버린다.
struct Target
{
    Scheme scheme{Scheme::Http};
    std::string host;
    std::uint16_t port{0};
    std::string path{"/"};

    [[nodiscard]] bool isTls() const noexcept { return scheme == Scheme::Https || scheme == Scheme::Wss; }
    [[nodiscard]] bool isWebSocket() const noexcept { return scheme == Scheme::Ws || scheme == Scheme::Wss; }
    [[nodiscard]] std::string portString() const { return std::to_string(port); }

    /// Host 헤더 값. 스킴 기본 포트면 포트를 생략한다.
    [[nodiscard]] std::string hostHeader() const;
};

[[nodiscard]] std::uint16_t defaultPort(Scheme scheme) noexcept;
[[nodiscard]] std::string_view toString(Scheme scheme) noexcept;

/// "scheme://host[:port][/path][?query][#fragment]" 파싱.
/// - 실패 시 nullopt, outError에 사람이 읽을 수 있는 원인을 남긴다.
/// - userinfo("user:pass@")는 지원하지 않는다.
[[nodiscard]] std::optional<Target> parseTarget(std::string_view url, std::string *outError = nullptr);

} // namespace hyperload::protocol
