#include <hyperload/LoadRunner.hpp>

#include <hyperload/core/Defaults.hpp>
#include <hyperload/core/Logger.hpp>
#include <hyperload/dispatch/WorkDistributor.hpp>
#include <hyperload/exec/ExecutorFactory.hpp>
#include <hyperload/stats/ResultAggregator.hpp>

#include <chrono>

namespace hyperload
{

LoadRunner::LoadRunner(RunConfig config, exec::ExecutorFactory factory)
    : config_(std::move(config)), factory_(std::move(factory))
{
}

stats::Summary LoadRunner::run()
{
    validateRunConfig(config_);
    const auto plan = dispatch::partitionWork(config_.totalUnits, config_.concurrency);

    exec::ExecutorFactory factory = factory_ ? factory_ : exec::makeExecutorFactory(config_.target, plan.size());

    HLOG_INFO("Runner", "Start", "url={} protocol={} units={} concurrency={} workers={}", config_.target.url,
              describeProtocol(config_.target.protocol), config_.totalUnits, config_.concurrency, plan.size());

    const auto begin = std::chrono::steady_clock::now();

    // rx가 distributor보다 먼저 소멸해야 막힌 워커가 풀린다
    dispatch::WorkDistributor distributor(std::move(factory));
    auto [tx, rx] = stats::ResultChannel::open(config_.concurrency * core::defaults::kChannelSlotsPerWorker);

    distributor.start(plan, std::move(tx));

    stats::ResultAggregator aggregator;
    const auto received = aggregator.drain(rx);

    auto outcomes = distributor.joinAll();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - begin);

    stats::AggregateState state = aggregator.takeState();
    stats::Summary summary = stats::SummaryBuilder::build(state, outcomes, elapsed);

    HLOG_INFO("Runner", "Done", "received={} success={} failure={} elapsed_ms={}", received, summary.successCount,
              summary.failureCount, std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    return summary;
}

} // namespace hyperload
