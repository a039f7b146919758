#pragma once

#include <atomic>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace hyperload::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

namespace detail
{
// 핫 패스 필터용 전역 레벨 (Logger.cpp에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

/// 로깅 백엔드 인터페이스.
/// message는 이미 "comp | evt | key=value..." 형태로 조립되어 들어온다.
class ILogger
{
  public:
    ILogger() = default;
    virtual ~ILogger() = default;

    ILogger(const ILogger &) = delete;
    ILogger &operator=(const ILogger &) = delete;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 스트림 기반 비동기 Logger.
/// - 호출 스레드는 이벤트를 큐에 넣기만 하고, 실제 출력은 전용 writer 스레드가 한다.
/// - 워커가 로그 출력 때문에 네트워크 측정 구간에서 막히지 않도록 하기 위함.
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    /// writer 스레드를 멈추고 남은 이벤트를 모두 flush 한다. (idempotent)
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

[[nodiscard]] const char *toString(LogLevel level) noexcept;

// =============================================================================
// Structured logging frontend
//   최종 라인: "HH:MM:SS.uuuuuu | w0 tid=123 | INFO  | comp | evt | k=v ..."
//   - prefix(time/thread/level)는 Logger가 붙인다
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    std::string details = std::format(fmt, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}
} // namespace slog

#define HLOG_TRACE(comp, evt, ...)                                                                 \
    ::hyperload::core::slog::emit(::hyperload::core::LogLevel::Trace, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define HLOG_DEBUG(comp, evt, ...)                                                                 \
    ::hyperload::core::slog::emit(::hyperload::core::LogLevel::Debug, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define HLOG_INFO(comp, evt, ...)                                                                  \
    ::hyperload::core::slog::emit(::hyperload::core::LogLevel::Info, (comp),                       \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define HLOG_WARN(comp, evt, ...)                                                                  \
    ::hyperload::core::slog::emit(::hyperload::core::LogLevel::Warn, (comp),                       \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define HLOG_ERROR(comp, evt, ...)                                                                 \
    ::hyperload::core::slog::emit(::hyperload::core::LogLevel::Error, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define HLOG_FATAL(comp, evt, ...)                                                                 \
    ::hyperload::core::slog::emit(::hyperload::core::LogLevel::Fatal, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace hyperload::core
