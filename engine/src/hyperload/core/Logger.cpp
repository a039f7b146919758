#include <hyperload/core/Logger.hpp>
#include <hyperload/core/ThreadTag.hpp>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <unistd.h> // isatty, fileno
#include <vector>

namespace hyperload::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

const char *toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

namespace
{

struct LogEvent
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string threadTag;
    long threadId{};
};

const char *colorFor(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "\x1b[90m";
    case LogLevel::Debug:
        return "\x1b[36m";
    case LogLevel::Info:
        return "\x1b[32m";
    case LogLevel::Warn:
        return "\x1b[33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\x1b[31m";
    }
    return "";
}

} // namespace

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : os_(os)
    {
        // 색상은 터미널로 나가는 표준 스트림일 때만
        if (&os == &std::cout || &os == &std::clog || &os == &std::cerr)
            useColor_ = (::isatty(::fileno(stderr)) != 0);
        writer_ = std::thread([this]() { drainLoop(); });
    }

    ~Impl() { stop(); }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_)
                return;
            stopped_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable())
            writer_.join();
    }

    void push(LogLevel level, std::string_view msg)
    {
        LogEvent ev{level, std::string(msg), std::chrono::system_clock::now(),
                    std::string(ThreadTag::tag()), ThreadTag::tid()};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_)
            {
                // writer가 이미 내려갔으면 호출 스레드에서 직접 쓴다 (종료 직전 로그 유실 방지)
                write(ev);
                os_.flush();
                return;
            }
            queue_.push(std::move(ev));
        }
        cv_.notify_one();
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(level, std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }

  private:
    void drainLoop()
    {
        for (;;)
        {
            std::vector<LogEvent> batch;
            bool exiting = false;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopped_ || !queue_.empty(); });
                while (!queue_.empty())
                {
                    batch.push_back(std::move(queue_.front()));
                    queue_.pop();
                }
                exiting = stopped_;
            }

            for (const auto &ev : batch)
            {
                if (ev.level < minLevel())
                    continue;
                write(ev);
            }
            os_.flush();

            if (exiting)
                return;
        }
    }

    void write(const LogEvent &ev)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(ev.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);
        const auto us = duration_cast<microseconds>(ev.timestamp.time_since_epoch()) % seconds(1);

        const char *c1 = useColor_ ? colorFor(ev.level) : "";
        const char *c2 = useColor_ ? "\x1b[0m" : "";

        os_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} tid={} | {}{:<5}{} | {}\n", tm.tm_hour,
                           tm.tm_min, tm.tm_sec, static_cast<int>(us.count()), ev.threadTag,
                           ev.threadId, c1, toString(ev.level), c2, ev.message);
    }

    std::ostream &os_;
    std::thread writer_;
    std::queue<LogEvent> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    bool useColor_{false};
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->push(level, message);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== Global instance =====

static std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}

ILogger &getLogger()
{
    auto &instance = globalLoggerStorage();
    if (!instance)
        instance = std::make_shared<Logger>();
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel lvl = logger ? logger->minLevel() : LogLevel::Info;
    detail::fastMinLevel().store(static_cast<int>(lvl), std::memory_order_relaxed);

    auto previous = std::exchange(globalLoggerStorage(), std::move(logger));
    if (previous)
        previous->shutdown();
}

void shutdownLogger() noexcept
{
    auto &instance = globalLoggerStorage();
    if (!instance)
        return;
    instance->shutdown();
    instance.reset();
}

} // namespace hyperload::core
