#include <hyperload/core/ConfigLoader.hpp>

#include <hyperload/core/Errors.hpp>
#include <hyperload/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <format>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace
{
using namespace hyperload;
using namespace hyperload::core;

[[noreturn]] void fail(const std::string &msg)
{
    throw ConfigurationError("[Config] " + msg);
}

std::string trim(std::string_view s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

std::int64_t parseInt(std::string_view text, std::string_view what)
{
    std::int64_t v = 0;
    const auto *first = text.data();
    const auto *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (text.empty() || ec != std::errc{} || ptr != last)
        fail(std::format("{} must be an integer: '{}'", what, text));
    return v;
}

std::size_t checkedSize(std::int64_t v, std::string_view what)
{
    if (v < 0)
        fail(std::format("{} must be non-negative: {}", what, v));
    return static_cast<std::size_t>(v);
}

std::chrono::seconds checkedSeconds(std::int64_t v, std::string_view what)
{
    if (v < 0 || v > std::numeric_limits<std::int32_t>::max())
        fail(std::format("{} out of range: {}", what, v));
    return std::chrono::seconds{v};
}

/// "Name: value" -> (Name, value). 첫 ':' 기준으로 자르고 양쪽 공백 제거.
std::pair<std::string, std::string> splitHeader(std::string_view raw)
{
    const auto colon = raw.find(':');
    if (colon == std::string_view::npos)
        fail(std::format("header must be 'Name: value': '{}'", raw));

    std::string name = trim(raw.substr(0, colon));
    if (name.empty())
        fail(std::format("header name is empty: '{}'", raw));
    return {std::move(name), trim(raw.substr(colon + 1))};
}

std::optional<std::string> scanCliForConfigPath(int argc, const char *const *argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                fail("--config requires a path");
            return std::string(argv[i + 1]);
        }
        if (a.starts_with("--config="))
            return std::string(a.substr(9));
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// TOML
// -----------------------------------------------------------------------------

void applyRunToml(RunConfig &cfg, const toml::table &root)
{
    const auto *run = root["run"].as_table();
    if (!run)
        return;

    if (auto s = (*run)["url"].value<std::string>())
        cfg.target.url = *s;
    if (auto s = (*run)["method"].value<std::string>())
        cfg.target.protocol = selectProtocol(*s);
    if (auto v = (*run)["concurrency"].value<std::int64_t>())
        cfg.concurrency = checkedSize(*v, "run.concurrency");
    if (auto v = (*run)["requests"].value<std::int64_t>())
        cfg.totalUnits = checkedSize(*v, "run.requests");
    if (auto s = (*run)["body"].value<std::string>())
        cfg.target.body = *s;
    if (auto s = (*run)["ws_message"].value<std::string>())
        cfg.target.wsMessage = *s;
    if (auto v = (*run)["ws_duration_sec"].value<std::int64_t>())
        cfg.target.wsHold = checkedSeconds(*v, "run.ws_duration_sec");
    if (auto v = (*run)["timeout_sec"].value<std::int64_t>())
        cfg.target.timeout = checkedSeconds(*v, "run.timeout_sec");

    if (const auto *headers = (*run)["headers"].as_table())
    {
        for (const auto &[key, node] : *headers)
        {
            auto value = node.value<std::string>();
            if (!value)
                fail(std::format("run.headers.{} must be a string", key.str()));
            cfg.target.headers[std::string(key.str())] = *value;
        }
    }
}

void applyLoggingToml(RunConfig &cfg, const toml::table &root)
{
    const auto *logging = root["logging"].as_table();
    if (!logging)
        return;

    if (auto s = (*logging)["level"].value<std::string>())
        cfg.logLevel = ConfigLoader::parseLogLevel(*s);
    if (auto s = (*logging)["file"].value<std::string>())
        cfg.logFilePath = *s;
}

void applyTomlFile(RunConfig &cfg, const std::string &path)
{
    if (!std::filesystem::exists(path))
        fail("config file not found: " + path);

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        fail(std::format("TOML parse error in {}: {}", path, e.description()));
    }

    applyRunToml(cfg, root);
    applyLoggingToml(cfg, root);
}

// -----------------------------------------------------------------------------
// CLI
// -----------------------------------------------------------------------------

struct CliArgs
{
    int argc;
    const char *const *argv;
    int i{1};

    /// "--flag value" 또는 "--flag=value"
    std::string takeValue(std::string_view flag, std::optional<std::string_view> inlineValue)
    {
        if (inlineValue)
            return std::string(*inlineValue);
        if (i + 1 >= argc || !argv[i + 1])
            fail(std::format("{} requires a value", flag));
        ++i;
        return std::string(argv[i]);
    }
};

/// -h/--help 를 만나면 즉시 false. 다른 옵션의 값 자리에 온 "-h"는 값으로 취급한다.
bool applyCli(RunConfig &cfg, int argc, const char *const *argv)
{
    CliArgs args{argc, argv};
    for (; args.i < argc; ++args.i)
    {
        std::string_view a = argv[args.i] ? std::string_view(argv[args.i]) : std::string_view{};
        std::string_view flag = a;
        std::optional<std::string_view> inlineValue;

        if (a.starts_with("--"))
        {
            const auto eq = a.find('=');
            if (eq != std::string_view::npos)
            {
                flag = a.substr(0, eq);
                inlineValue = a.substr(eq + 1);
            }
        }

        if (flag == "-h" || flag == "--help")
        {
            return false;
        }
        else if (flag == "--config")
        {
            (void)args.takeValue(flag, inlineValue); // scanCliForConfigPath에서 처리
        }
        else if (flag == "-u" || flag == "--url")
        {
            cfg.target.url = args.takeValue(flag, inlineValue);
        }
        else if (flag == "-m" || flag == "--method")
        {
            cfg.target.protocol = selectProtocol(args.takeValue(flag, inlineValue));
        }
        else if (flag == "-c" || flag == "--concurrency")
        {
            cfg.concurrency = checkedSize(parseInt(args.takeValue(flag, inlineValue), flag), flag);
        }
        else if (flag == "-r" || flag == "--requests")
        {
            cfg.totalUnits = checkedSize(parseInt(args.takeValue(flag, inlineValue), flag), flag);
        }
        else if (flag == "-d" || flag == "--data")
        {
            cfg.target.body = args.takeValue(flag, inlineValue);
        }
        else if (flag == "-H" || flag == "--header")
        {
            auto [name, value] = splitHeader(args.takeValue(flag, inlineValue));
            cfg.target.headers[name] = std::move(value);
        }
        else if (flag == "--ws-message")
        {
            cfg.target.wsMessage = args.takeValue(flag, inlineValue);
        }
        else if (flag == "--ws-duration")
        {
            cfg.target.wsHold = checkedSeconds(parseInt(args.takeValue(flag, inlineValue), flag), flag);
        }
        else if (flag == "-t" || flag == "--timeout")
        {
            cfg.target.timeout = checkedSeconds(parseInt(args.takeValue(flag, inlineValue), flag), flag);
        }
        else if (flag == "--log-level")
        {
            cfg.logLevel = ConfigLoader::parseLogLevel(args.takeValue(flag, inlineValue));
        }
        else if (flag == "--log-file")
        {
            cfg.logFilePath = args.takeValue(flag, inlineValue);
        }
        else
        {
            fail(std::format("unknown argument: '{}'", a));
        }
    }
    return true;
}

std::string exeName(const char *argv0)
{
    if (!argv0 || !*argv0)
        return "hyperload";
    return std::filesystem::path(argv0).filename().string();
}

} // namespace

namespace hyperload::core
{

LogLevel ConfigLoader::parseLogLevel(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    fail("invalid log level: " + std::string(s));
}

std::string ConfigLoader::usage(std::string_view exe)
{
    return std::format("Usage: {} -u <url> [options]\n"
                       "\n"
                       "  -u, --url <url>            target URL (http, https, ws, wss)\n"
                       "  -m, --method <name>        GET POST PUT DELETE PATCH HEAD OPTIONS, or WS (default GET)\n"
                       "  -c, --concurrency <n>      concurrent workers (default 1)\n"
                       "  -r, --requests <n>         total requests or sessions (default 1)\n"
                       "  -d, --data <body>          request body\n"
                       "  -H, --header <'K: V'>      request header, repeatable\n"
                       "      --ws-message <text>    text message sent once per WebSocket session\n"
                       "      --ws-duration <sec>    seconds to hold each WebSocket session open\n"
                       "  -t, --timeout <sec>        per-request timeout (default 30)\n"
                       "      --log-level <level>    trace|debug|info|warn|error|fatal (default info)\n"
                       "      --log-file <path>      append logs to a file\n"
                       "      --config <path.toml>   load settings from TOML, flags override\n"
                       "  -h, --help                 show this help\n",
                       exe);
}

std::optional<RunConfig> ConfigLoader::load(int argc, const char *const *argv, std::ostream &out)
{
    RunConfig cfg{};

    // 1. 파일 -> 2. 플래그 (덮어쓰기)
    if (auto path = scanCliForConfigPath(argc, argv))
        applyTomlFile(cfg, *path);
    if (!applyCli(cfg, argc, argv))
    {
        out << usage(exeName(argc > 0 ? argv[0] : nullptr));
        return std::nullopt;
    }

    if (cfg.target.url.empty())
        fail("missing required argument: -u/--url (or run.url in the config file)");

    validateRunConfig(cfg);
    return cfg;
}

} // namespace hyperload::core
