#include <hyperload/protocol/HttpMethod.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace hyperload::protocol
{
namespace
{
constexpr std::array<std::pair<std::string_view, HttpMethod>, 7> kMethods{{
    {"GET", HttpMethod::Get},
    {"POST", HttpMethod::Post},
    {"PUT", HttpMethod::Put},
    {"DELETE", HttpMethod::Delete},
    {"PATCH", HttpMethod::Patch},
    {"HEAD", HttpMethod::Head},
    {"OPTIONS", HttpMethod::Options},
}};

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}
} // namespace

HttpMethod parseHttpMethod(std::string_view name) noexcept
{
    for (const auto &[text, method] : kMethods)
    {
        if (equalsIgnoreCase(text, name))
            return method;
    }
    return HttpMethod::Unsupported;
}

std::string_view toString(HttpMethod method) noexcept
{
    for (const auto &[text, m] : kMethods)
    {
        if (m == method)
            return text;
    }
    return "UNSUPPORTED";
}

} // namespace hyperload::protocol
