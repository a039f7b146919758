#include <hyperload/report/ReportPrinter.hpp>

#include <format>

namespace hyperload::report
{

void printBanner(std::ostream &os, const RunConfig &config)
{
    const auto &t = config.target;

    os << "\n--- Load test started ---\n";
    os << std::format("Target URL: {}\n", t.url);
    os << std::format("Protocol/method: {}\n", describeProtocol(t.protocol));
    os << std::format("Concurrency: {}\n", config.concurrency);
    os << std::format("Total requests/sessions: {}\n", config.totalUnits);
    os << std::format("Timeout: {}s\n", t.timeout.count());

    if (t.isWebSocket())
    {
        if (t.wsHold)
            os << std::format("WebSocket hold: {} s\n", t.wsHold->count());
        if (t.wsMessage)
            os << std::format("WebSocket message: {}\n", *t.wsMessage);
    }
    else if (t.body)
    {
        os << std::format("Request body: {}\n", *t.body);
    }

    if (!t.headers.empty())
    {
        os << "Headers:\n";
        for (const auto &[name, value] : t.headers)
            os << std::format("  {}: {}\n", name, value);
    }
}

void printReport(std::ostream &os, const RunConfig &config, const stats::Summary &s)
{
    os << std::format("\n--- Load test results ({}) ---\n", describeProtocol(config.target.protocol));
    os << std::format("Total duration: {:.3f} s\n", s.elapsedSeconds());
    os << std::format("Successful requests/sessions: {}\n", s.successCount);
    os << std::format("Failed requests/sessions: {}\n", s.failureCount);
    os << std::format("Total requests/sessions: {}\n", s.totalExecuted);

    if (s.rps)
        os << std::format("Requests per second (RPS): {:.2f}\n", *s.rps);
    else
        os << "Requests per second (RPS): N/A (duration too short)\n";

    if (s.latency)
    {
        const auto &l = *s.latency;
        os << std::format("Mean latency: {:.2f} ms\n", l.meanMs);
        os << std::format("Min latency: {:.2f} ms\n", static_cast<double>(l.minMs));
        os << std::format("Max latency: {:.2f} ms\n", static_cast<double>(l.maxMs));
        os << "Latency percentiles:\n";
        os << std::format("  50% (P50): {:.2f} ms\n", static_cast<double>(l.p50Ms));
        os << std::format("  90% (P90): {:.2f} ms\n", static_cast<double>(l.p90Ms));
        os << std::format("  95% (P95): {:.2f} ms\n", static_cast<double>(l.p95Ms));
        os << std::format("  99% (P99): {:.2f} ms\n", static_cast<double>(l.p99Ms));
    }
    else
    {
        os << "No successful requests; latency statistics unavailable.\n";
    }

    if (!s.statusCodes.empty())
    {
        os << "\nHTTP status code distribution:\n";
        for (const auto &[code, count] : s.statusCodes)
            os << std::format("  - {}: {} times\n", code, count);
    }

    if (!s.errors.empty())
    {
        os << "\nError details:\n";
        for (const auto &[msg, count] : s.errors)
            os << std::format("  - {}: {} times\n", msg, count);
    }

    if (s.abnormalWorkers > 0)
        os << std::format("\nWorkers terminated abnormally: {}\n", s.abnormalWorkers);
}

} // namespace hyperload::report
