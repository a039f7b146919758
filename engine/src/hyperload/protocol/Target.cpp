#include <hyperload/protocol/Target.hpp>

#include <cctype>
#include <charconv>

namespace hyperload::protocol
{
namespace
{

std::optional<Target> fail(std::string *outError, std::string msg)
{
    if (outError)
        *outError = std::move(msg);
    return std::nullopt;
}

std::optional<Scheme> parseScheme(std::string_view s) noexcept
{
    std::string lower(s);
    for (auto &c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "http")
        return Scheme::Http;
    if (lower == "https")
        return Scheme::Https;
    if (lower == "ws")
        return Scheme::Ws;
    if (lower == "wss")
        return Scheme::Wss;
    return std::nullopt;
}

bool parsePort(std::string_view s, std::uint16_t &out) noexcept
{
    if (s.empty())
        return false;
    unsigned int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return false;
    if (v == 0 || v > 65535)
        return false;
    out = static_cast<std::uint16_t>(v);
    return true;
}

} // namespace

std::uint16_t defaultPort(Scheme scheme) noexcept
{
    switch (scheme)
    {
    case Scheme::Http:
    case Scheme::Ws:
        return 80;
    case Scheme::Https:
    case Scheme::Wss:
        return 443;
    }
    return 80;
}

std::string_view toString(Scheme scheme) noexcept
{
    switch (scheme)
    {
    case Scheme::Http:
        return "http";
    case Scheme::Https:
        return "https";
    case Scheme::Ws:
        return "ws";
    case Scheme::Wss:
        return "wss";
    }
    return "http";
}

std::string Target::hostHeader() const
{
    const bool v6 = host.find(':') != std::string::npos;
    std::string h = v6 ? "[" + host + "]" : host;
    if (port != defaultPort(scheme))
        h += ":" + std::to_string(port);
    return h;
}

std::optional<Target> parseTarget(std::string_view url, std::string *outError)
{
    const std::size_t sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0)
        return fail(outError, "missing scheme in '" + std::string(url) + "'");

    const auto scheme = parseScheme(url.substr(0, sep));
    if (!scheme)
        return fail(outError, "unsupported scheme '" + std::string(url.substr(0, sep)) + "'");

    std::string_view rest = url.substr(sep + 3);

    // fragment는 서버로 보내지 않는다
    if (const auto hash = rest.find('#'); hash != std::string_view::npos)
        rest = rest.substr(0, hash);

    const std::size_t pathStart = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, pathStart);
    std::string_view path = (pathStart == std::string_view::npos) ? std::string_view{} : rest.substr(pathStart);

    if (authority.empty())
        return fail(outError, "empty host");
    if (authority.find('@') != std::string_view::npos)
        return fail(outError, "userinfo in url is not supported");

    Target t{};
    t.scheme = *scheme;
    t.port = defaultPort(*scheme);

    std::string_view host;
    std::string_view portText;
    if (authority.front() == '[')
    {
        const std::size_t close = authority.find(']');
        if (close == std::string_view::npos)
            return fail(outError, "unterminated IPv6 literal");
        host = authority.substr(1, close - 1);
        std::string_view tail = authority.substr(close + 1);
        if (!tail.empty())
        {
            if (tail.front() != ':')
                return fail(outError, "unexpected characters after IPv6 literal");
            portText = tail.substr(1);
            if (portText.empty())
                return fail(outError, "empty port");
        }
    }
    else
    {
        const std::size_t colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos)
        {
            portText = authority.substr(colon + 1);
            if (portText.empty())
                return fail(outError, "empty port");
        }
        if (host.find(':') != std::string_view::npos)
            return fail(outError, "IPv6 host must be bracketed");
    }

    if (host.empty())
        return fail(outError, "empty host");
    for (char c : host)
    {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '\\')
            return fail(outError, "invalid character in host '" + std::string(host) + "'");
    }

    if (!portText.empty() && !parsePort(portText, t.port))
        return fail(outError, "invalid port '" + std::string(portText) + "'");

    t.host = std::string(host);
    if (path.empty())
        t.path = "/";
    else if (path.front() == '?')
        t.path = "/" + std::string(path);
    else
        t.path = std::string(path);

    for (char c : t.path)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
            return fail(outError, "whitespace in path");
    }

    return t;
}

} // namespace hyperload::protocol
