#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hyperload::stats
{

/// 작업 단위 1건(HTTP 호출 1회 / WebSocket 세션 1회)의 결과.
/// - success == true 이면 error는 비어 있다.
/// - statusCode는 서버 응답을 받은 HTTP 시도에만 존재한다 (non-2xx 실패 포함).
struct RequestResult
{
    std::chrono::nanoseconds elapsed{0};
    bool success{false};
    std::optional<std::uint16_t> statusCode;
    std::optional<std::string> error;

    static RequestResult ok(std::chrono::nanoseconds elapsed,
                            std::optional<std::uint16_t> status = std::nullopt)
    {
        return RequestResult{elapsed, true, status, std::nullopt};
    }

    static RequestResult failed(std::chrono::nanoseconds elapsed, std::string error,
                                std::optional<std::uint16_t> status = std::nullopt)
    {
        return RequestResult{elapsed, false, status, std::move(error)};
    }
};

/// 결과 없이 끝난 작업 단위를 집계할 때 쓰는 오류 키
inline constexpr const char *kWorkerTaskFailureKey = "worker task failure";

/// error가 비어 있는 실패 결과의 집계 키
inline constexpr const char *kUnknownErrorKey = "unknown error";

} // namespace hyperload::stats
