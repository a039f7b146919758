#pragma once

#include <cstdint>
#include <string_view>

namespace hyperload::protocol
{

enum class HttpMethod : std::uint8_t
{
    Get,
    Post,
    Put,
    Delete,
    Patch,
    Head,
    Options,
    Unsupported
};

/// 대소문자 무시. 목록에 없는 이름은 Unsupported.
[[nodiscard]] HttpMethod parseHttpMethod(std::string_view name) noexcept;

[[nodiscard]] std::string_view toString(HttpMethod method) noexcept;

} // namespace hyperload::protocol
