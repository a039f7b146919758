#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <hyperload/core/Defaults.hpp>
#include <hyperload/core/Logger.hpp>
#include <hyperload/protocol/HttpMethod.hpp>

namespace hyperload
{

/// HTTP 요청 모드. methodName은 Unsupported일 때 오류 메시지용으로 원문을 보존한다.
struct HttpProtocol
{
    protocol::HttpMethod method{protocol::HttpMethod::Get};
    std::string methodName{"GET"};
};

/// WebSocket 세션 모드.
struct WebSocketProtocol
{
};

/// 프로토콜 선택은 설정 시점에 한 번만 결정된다.
using ProtocolSelector = std::variant<HttpProtocol, WebSocketProtocol>;

/// 모든 워커가 읽기 전용으로 공유하는 대상 설정입니다.
struct TargetConfig
{
    /// 대상 URL. http(s):// 또는 ws(s)://
    std::string url;

    ProtocolSelector protocol{HttpProtocol{}};

    /// 요청 본문 (HTTP 전용)
    std::optional<std::string> body;

    /// 헤더 이름 -> 값. 같은 이름이 다시 들어오면 마지막 값이 이긴다.
    std::map<std::string, std::string> headers;

    /// 연결 직후 한 번 보낼 텍스트 메시지 (WebSocket 전용)
    std::optional<std::string> wsMessage;

    /// 세션 유지 시간 (WebSocket 전용)
    std::optional<std::chrono::seconds> wsHold;

    /// HTTP 호출 1건 / WebSocket 연결 수립에 적용되는 타임아웃
    std::chrono::seconds timeout{core::defaults::kTimeoutSec};

    [[nodiscard]] bool isWebSocket() const noexcept
    {
        return std::holds_alternative<WebSocketProtocol>(protocol);
    }
};

/// 실행 전체 설정.
struct RunConfig
{
    TargetConfig target{};

    /// 동시 워커 수 (C)
    std::size_t concurrency = core::defaults::kConcurrency;

    /// 총 작업 단위 수 (N): HTTP 요청 수 또는 WebSocket 세션 수
    std::size_t totalUnits = core::defaults::kTotalUnits;

    /// 로그 파일 경로. 빈 문자열이면 std::clog
    std::string logFilePath;

    core::LogLevel logLevel = core::LogLevel::Info;
};

/// "GET", "post", "WS" 같은 사용자 입력을 프로토콜 선택으로 바꾼다.
/// - "WS"(대소문자 무시)는 WebSocket, 그 외는 HTTP 메서드로 해석한다.
/// - 알 수 없는 HTTP 메서드도 오류가 아니다 (호출마다 즉시 실패 결과가 된다).
[[nodiscard]] ProtocolSelector selectProtocol(std::string_view methodOrWs);

/// 사람이 읽는 프로토콜 이름 ("GET", "WebSocket" ...)
[[nodiscard]] std::string describeProtocol(const ProtocolSelector &protocol);

/// 실행 전 검증. 위반 시 core::ConfigurationError.
void validateRunConfig(const RunConfig &config);

} // namespace hyperload
