#include <hyperload/stats/ResultAggregator.hpp>

#include <hyperload/core/Defaults.hpp>
#include <hyperload/core/Logger.hpp>

namespace hyperload::stats
{

ResultAggregator::ResultAggregator()
    : state_{LatencyHistogram{core::defaults::kHistogramSignificantDigits,
                              core::defaults::kHistogramInitialHighestMs},
             {},
             {},
             0,
             0}
{
}

std::uint64_t ResultAggregator::toHistogramMs(std::chrono::nanoseconds elapsed) noexcept
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (ms < static_cast<long long>(core::defaults::kHistogramLowestValueMs))
        return core::defaults::kHistogramLowestValueMs;
    return static_cast<std::uint64_t>(ms);
}

void ResultAggregator::consume(const RequestResult &result)
{
    if (result.success)
    {
        ++state_.successCount;

        const std::uint64_t ms = toHistogramMs(result.elapsed);
        if (!state_.latencyMs.record(ms))
            HLOG_ERROR("Aggregator", "HistogramRecordFailed", "value_ms={}", ms);
    }
    else
    {
        ++state_.failureCount;
        ++state_.errorCounts[result.error ? *result.error : std::string(kUnknownErrorKey)];
    }

    if (result.statusCode)
        ++state_.statusCounts[*result.statusCode];
}

std::uint64_t ResultAggregator::drain(ResultChannel::Receiver &rx)
{
    std::uint64_t consumed = 0;
    while (auto result = rx.recv())
    {
        consume(*result);
        ++consumed;

        HLOG_TRACE("Aggregator", "Result", "ok={} status={} elapsed_us={}", result->success,
                   result->statusCode ? static_cast<int>(*result->statusCode) : 0,
                   std::chrono::duration_cast<std::chrono::microseconds>(result->elapsed).count());
    }

    HLOG_DEBUG("Aggregator", "ChannelClosed", "consumed={} success={} failure={}", consumed,
               state_.successCount, state_.failureCount);
    return consumed;
}

} // namespace hyperload::stats
