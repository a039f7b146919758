#include <hyperload/stats/Summary.hpp>

#include <chrono>
#include <cmath>
#include <iostream>

using namespace std::chrono_literals;
using hyperload::dispatch::WorkerOutcome;
using hyperload::stats::AggregateState;
using hyperload::stats::RequestResult;
using hyperload::stats::ResultAggregator;
using hyperload::stats::SummaryBuilder;

namespace {

bool test_rps_unavailable_when_elapsed_zero() {
    ResultAggregator agg;
    agg.consume(RequestResult::ok(2ms, 200));
    auto state = agg.takeState();

    const auto s = SummaryBuilder::build(state, {}, 0ns);
    if (s.rps.has_value()) {
        std::cerr << "[rps_zero] rps should be unavailable\n";
        return false;
    }
    return s.totalExecuted == 1;
}

bool test_rps_and_latency() {
    ResultAggregator agg;
    for (int i = 1; i <= 10; ++i)
        agg.consume(RequestResult::ok(std::chrono::milliseconds(i * 10), 200));
    agg.consume(RequestResult::failed(1ms, "HTTP status: 404 Not Found", 404));
    auto state = agg.takeState();

    const auto s = SummaryBuilder::build(state, {}, 2s);
    if (!s.rps || std::fabs(*s.rps - 5.5) > 1e-9) {
        std::cerr << "[rps] expected 5.5\n";
        return false;
    }
    if (!s.latency) {
        std::cerr << "[rps] latency missing\n";
        return false;
    }
    const auto &l = *s.latency;
    if (l.minMs != 10 || l.maxMs != 100 || l.p50Ms != 50 || l.p90Ms != 90 || l.p99Ms != 100 ||
        std::fabs(l.meanMs - 55.0) > 1e-9) {
        std::cerr << "[rps] latency mismatch min=" << l.minMs << " max=" << l.maxMs << " p50=" << l.p50Ms
                  << " mean=" << l.meanMs << "\n";
        return false;
    }
    if (!(l.p50Ms <= l.p90Ms && l.p90Ms <= l.p95Ms && l.p95Ms <= l.p99Ms)) {
        std::cerr << "[rps] percentiles not ordered\n";
        return false;
    }
    return true;
}

/// 성공이 없으면 지연 통계는 "no data"
bool test_no_latency_without_success() {
    ResultAggregator agg;
    agg.consume(RequestResult::failed(4ms, "connect: Connection refused"));
    auto state = agg.takeState();

    const auto s = SummaryBuilder::build(state, {}, 1s);
    return !s.latency.has_value() && s.failureCount == 1 && s.statusCodes.empty();
}

/// 상태 코드는 오름차순, 오류는 메시지 오름차순
bool test_sorted_distributions() {
    ResultAggregator agg;
    agg.consume(RequestResult::failed(1ms, "b-error", 503));
    agg.consume(RequestResult::ok(1ms, 204));
    agg.consume(RequestResult::failed(1ms, "a-error", 404));
    agg.consume(RequestResult::ok(1ms, 200));
    auto state = agg.takeState();

    const auto s = SummaryBuilder::build(state, {}, 1s);
    if (s.statusCodes.size() != 4 || s.statusCodes[0].first != 200 || s.statusCodes[1].first != 204 ||
        s.statusCodes[2].first != 404 || s.statusCodes[3].first != 503) {
        std::cerr << "[sorted] status order mismatch\n";
        return false;
    }
    if (s.errors.size() != 2 || s.errors[0].first != "a-error" || s.errors[1].first != "b-error") {
        std::cerr << "[sorted] error order mismatch\n";
        return false;
    }
    return true;
}

/// 비정상 종료 워커의 미보고분은 실패로 합쳐져 총합이 N을 유지합니다.
bool test_worker_failures_folded() {
    ResultAggregator agg;
    for (int i = 0; i < 3; ++i)
        agg.consume(RequestResult::ok(5ms, 200));
    auto state = agg.takeState();

    std::vector<WorkerOutcome> outcomes;
    outcomes.push_back(WorkerOutcome{0, 3, 3, false, {}});
    outcomes.push_back(WorkerOutcome{1, 3, 0, true, "executor factory failed"});
    outcomes.push_back(WorkerOutcome{2, 2, 2, true, "late failure"}); // 전부 보고 후 중단 -> 최소 1

    const auto s = SummaryBuilder::build(state, outcomes, 1s);
    if (s.totalExecuted != 3 + 3 + 1 || s.failureCount != 4 || s.abnormalWorkers != 2) {
        std::cerr << "[fold] total=" << s.totalExecuted << " failure=" << s.failureCount << "\n";
        return false;
    }
    if (s.errors.size() != 1 || s.errors[0].first != hyperload::stats::kWorkerTaskFailureKey ||
        s.errors[0].second != 4) {
        std::cerr << "[fold] error tally mismatch\n";
        return false;
    }
    if (!s.latency || s.latency->minMs != 5) {
        std::cerr << "[fold] worker failures must not enter the histogram\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_rps_unavailable_when_elapsed_zero();
    ok = ok && test_rps_and_latency();
    ok = ok && test_no_latency_without_success();
    ok = ok && test_sorted_distributions();
    ok = ok && test_worker_failures_folded();

    if (!ok) {
        std::cerr << "SummaryBuilder tests FAILED\n";
        return 1;
    }

    std::cout << "SummaryBuilder tests PASSED\n";
    return 0;
}
