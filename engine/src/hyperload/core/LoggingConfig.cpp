#include <hyperload/core/LoggingConfig.hpp>
#include <hyperload/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace hyperload::core
{
namespace
{

// 출력 스트림의 수명을 Logger와 함께 묶어 둔다. (파일 스트림이 Logger보다 먼저 닫히지 않도록)
class StreamOwningLogger final : public ILogger
{
  public:
    StreamOwningLogger(std::shared_ptr<std::ostream> os, LogLevel lvl)
        : os_(std::move(os)), logger_(*os_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::shared_ptr<std::ostream> os_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const hyperload::RunConfig &cfg)
{
    if (cfg.logFilePath.empty())
    {
        auto os = std::shared_ptr<std::ostream>(&std::clog, [](std::ostream *) {});
        setLogger(std::make_shared<StreamOwningLogger>(std::move(os), cfg.logLevel));
        return;
    }

    auto file = std::make_shared<std::ofstream>(cfg.logFilePath, std::ios::app);
    if (!file->is_open())
        throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);

    setLogger(std::make_shared<StreamOwningLogger>(std::move(file), cfg.logLevel));
}

} // namespace hyperload::core
