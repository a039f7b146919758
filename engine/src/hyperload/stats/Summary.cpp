#include <hyperload/stats/Summary.hpp>

#include <hyperload/core/Logger.hpp>

namespace hyperload::stats
{

std::uint64_t SummaryBuilder::foldWorkerFailures(AggregateState &state,
                                                 const std::vector<dispatch::WorkerOutcome> &outcomes)
{
    std::uint64_t added = 0;
    for (const auto &o : outcomes)
    {
        if (!o.abnormal)
            continue;

        const std::uint64_t missing = o.unaccounted();
        state.failureCount += missing;
        state.errorCounts[kWorkerTaskFailureKey] += missing;
        added += missing;

        HLOG_WARN("Summary", "WorkerTaskFailure", "worker={} assigned={} reported={} counted={} reason='{}'",
                  o.workerIndex, o.assigned, o.reported, missing, o.reason);
    }
    return added;
}

Summary SummaryBuilder::build(AggregateState &state, const std::vector<dispatch::WorkerOutcome> &outcomes,
                              std::chrono::nanoseconds elapsed)
{
    (void)foldWorkerFailures(state, outcomes);

    Summary s{};
    s.elapsed = elapsed;
    s.successCount = state.successCount;
    s.failureCount = state.failureCount;
    s.totalExecuted = state.successCount + state.failureCount;

    for (const auto &o : outcomes)
    {
        if (o.abnormal)
            ++s.abnormalWorkers;
    }

    if (elapsed.count() > 0)
        s.rps = static_cast<double>(s.totalExecuted) / s.elapsedSeconds();

    const auto &h = state.latencyMs;
    if (state.successCount > 0 && !h.empty())
    {
        LatencySummary lat{};
        lat.meanMs = h.mean();
        lat.minMs = h.min();
        lat.maxMs = h.max();
        lat.p50Ms = h.valueAtPercentile(50.0);
        lat.p90Ms = h.valueAtPercentile(90.0);
        lat.p95Ms = h.valueAtPercentile(95.0);
        lat.p99Ms = h.valueAtPercentile(99.0);
        s.latency = lat;
    }

    // std::map 순회 순서 == 키 오름차순
    s.statusCodes.assign(state.statusCounts.begin(), state.statusCounts.end());
    s.errors.assign(state.errorCounts.begin(), state.errorCounts.end());
    return s;
}

} // namespace hyperload::stats
