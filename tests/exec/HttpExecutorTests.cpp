#include "../support/TestServers.hpp"

#include <hyperload/LoadRunner.hpp>
#include <hyperload/exec/HttpExecutor.hpp>
#include <hyperload/net/HttpClient.hpp>

#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using hyperload::HttpProtocol;
using hyperload::LoadRunner;
using hyperload::RunConfig;
using hyperload::TargetConfig;
using hyperload::exec::HttpExecutor;
using hyperload::net::HttpClient;
using hyperload::test::HttpTestServer;

namespace {

RunConfig makeRun(const std::string &url, std::size_t units, std::size_t concurrency, const char *method = "GET") {
    RunConfig cfg{};
    cfg.target.url = url;
    cfg.target.protocol = hyperload::selectProtocol(method);
    cfg.target.timeout = 5s;
    cfg.totalUnits = units;
    cfg.concurrency = concurrency;
    return cfg;
}

/// 항상 200을 주는 서버: 성공 5, 상태 분포 {200:5}
bool test_get_200() {
    HttpTestServer server(200, "hello");
    LoadRunner runner(makeRun(server.url("/ok"), 5, 2));
    const auto s = runner.run();

    if (s.successCount != 5 || s.failureCount != 0) {
        std::cerr << "[200] success=" << s.successCount << " failure=" << s.failureCount << "\n";
        for (const auto &[msg, n] : s.errors)
            std::cerr << "  error: " << msg << " x" << n << "\n";
        return false;
    }
    if (s.statusCodes.size() != 1 || s.statusCodes[0].first != 200 || s.statusCodes[0].second != 5) {
        std::cerr << "[200] status distribution mismatch\n";
        return false;
    }
    if (server.requestsServed() != 5 || server.lastRequest().target != "/ok") {
        std::cerr << "[200] server saw " << server.requestsServed() << " requests\n";
        return false;
    }
    return s.latency.has_value() && s.errors.empty();
}

/// 항상 500: 실패 5, 상태 {500:5}, 오류 키 1개
bool test_get_500() {
    HttpTestServer server(500, "nope");
    LoadRunner runner(makeRun(server.url(), 5, 3));
    const auto s = runner.run();

    if (s.failureCount != 5 || s.successCount != 0) {
        std::cerr << "[500] failure=" << s.failureCount << "\n";
        return false;
    }
    if (s.statusCodes.size() != 1 || s.statusCodes[0].first != 500 || s.statusCodes[0].second != 5) {
        std::cerr << "[500] status distribution mismatch\n";
        return false;
    }
    if (s.errors.size() != 1 || s.errors[0].first != "HTTP status: 500 Internal Server Error" ||
        s.errors[0].second != 5) {
        std::cerr << "[500] error tally mismatch: " << (s.errors.empty() ? "<none>" : s.errors[0].first) << "\n";
        return false;
    }
    return !s.latency.has_value();
}

/// 닫힌 포트: 실패 3, 상태 코드 없음, 오류 키 1개
bool test_unreachable() {
    const auto port = hyperload::test::unusedLoopbackPort();
    LoadRunner runner(makeRun(std::format("http://127.0.0.1:{}/", port), 3, 1));
    const auto s = runner.run();

    if (s.failureCount != 3 || !s.statusCodes.empty()) {
        std::cerr << "[unreachable] failure=" << s.failureCount << " statuses=" << s.statusCodes.size() << "\n";
        return false;
    }
    if (s.errors.size() != 1 || s.errors[0].second != 3 || s.errors[0].first.rfind("connect: ", 0) != 0) {
        std::cerr << "[unreachable] error tally mismatch: " << (s.errors.empty() ? "<none>" : s.errors[0].first)
                  << "\n";
        return false;
    }
    return true;
}

/// 지원하지 않는 메서드는 네트워크 없이 즉시 실패
bool test_unsupported_method_no_network() {
    HttpTestServer server(200);
    LoadRunner runner(makeRun(server.url(), 4, 2, "BREW"));
    const auto s = runner.run();

    if (s.failureCount != 4 || server.connectionsAccepted() != 0 || server.requestsServed() != 0) {
        std::cerr << "[unsupported] failure=" << s.failureCount << " accepted=" << server.connectionsAccepted()
                  << "\n";
        return false;
    }
    if (s.errors.size() != 1 || s.errors[0].first != "unsupported HTTP method: BREW") {
        std::cerr << "[unsupported] error mismatch\n";
        return false;
    }
    return true;
}

/// 같은 lane의 연속 호출은 keep-alive 연결 하나를 재사용한다.
bool test_keep_alive_reuse_and_request_shape() {
    HttpTestServer server(201);

    TargetConfig target{};
    target.url = server.url("/items?x=1");
    target.timeout = 5s;
    target.body = "{\"a\":1}";
    target.headers["Content-Type"] = "application/json";
    target.headers["User-Agent"] = "custom-agent";

    auto client = std::make_shared<HttpClient>(1, target.timeout);
    HttpExecutor exec(client, 0, target, HttpProtocol{hyperload::protocol::HttpMethod::Post, "POST"});

    for (int i = 0; i < 5; ++i) {
        const auto r = exec.execute();
        if (!r.success || r.statusCode.value_or(0) != 201 || r.error) {
            std::cerr << "[reuse] call " << i << " failed: " << r.error.value_or("") << "\n";
            return false;
        }
    }

    if (client->connectionsOpened() != 1 || server.connectionsAccepted() != 1) {
        std::cerr << "[reuse] opened=" << client->connectionsOpened() << " accepted=" << server.connectionsAccepted()
                  << "\n";
        return false;
    }

    const auto seen = server.lastRequest();
    if (seen.method != "POST" || seen.target != "/items?x=1" || seen.body != "{\"a\":1}" ||
        seen.headers["Content-Type"] != "application/json" || seen.headers["User-Agent"] != "custom-agent" ||
        seen.headers["Host"] != std::format("127.0.0.1:{}", server.port())) {
        std::cerr << "[reuse] request shape mismatch method=" << seen.method << " target=" << seen.target << "\n";
        return false;
    }
    return true;
}

/// HEAD 응답은 본문이 없어도 정상 완료된다.
bool test_head_request() {
    HttpTestServer server(200, "this body is not sent for HEAD");
    LoadRunner runner(makeRun(server.url(), 3, 1, "head"));
    const auto s = runner.run();
    if (s.successCount != 3) {
        std::cerr << "[head] success=" << s.successCount << "\n";
        for (const auto &[msg, n] : s.errors)
            std::cerr << "  error: " << msg << " x" << n << "\n";
        return false;
    }
    return true;
}

/// 서버가 연결을 닫아도(Connection: close) 다음 호출은 새 연결로 성공한다.
bool test_server_closes_connection() {
    HttpTestServer server(200);

    TargetConfig target{};
    target.url = server.url();
    target.timeout = 5s;
    target.headers["Connection"] = "close";

    auto client = std::make_shared<HttpClient>(1, target.timeout);
    HttpExecutor exec(client, 0, target, HttpProtocol{});

    for (int i = 0; i < 3; ++i) {
        const auto r = exec.execute();
        if (!r.success) {
            std::cerr << "[close] call " << i << " failed: " << r.error.value_or("") << "\n";
            return false;
        }
    }
    return client->connectionsOpened() == 3;
}

/// 응답 없는 서버: 호출마다 timeout 만큼 기다린 뒤 read 단계 timeout으로 실패
bool test_timeout_while_waiting_for_reply() {
    HttpTestServer server(200, "ok", HttpTestServer::Mode::NeverReply);

    auto cfg = makeRun(server.url(), 2, 1);
    cfg.target.timeout = 1s;
    LoadRunner runner(cfg);
    const auto s = runner.run();

    if (s.failureCount != 2 || s.successCount != 0 || !s.statusCodes.empty()) {
        std::cerr << "[timeout] failure=" << s.failureCount << " statuses=" << s.statusCodes.size() << "\n";
        return false;
    }
    if (s.errors.size() != 1 || s.errors[0].second != 2 ||
        s.errors[0].first.rfind("timeout: no response within 1s (stage=read)", 0) != 0) {
        std::cerr << "[timeout] error tally mismatch: " << (s.errors.empty() ? "<none>" : s.errors[0].first) << "\n";
        return false;
    }
    if (s.elapsed < 1900ms || server.requestsServed() != 2) {
        std::cerr << "[timeout] run finished too early or server saw " << server.requestsServed() << "\n";
        return false;
    }

    auto client = std::make_shared<HttpClient>(1, 1s);
    HttpExecutor exec(client, 0, cfg.target, HttpProtocol{});
    const auto r = exec.execute();
    if (r.success || r.statusCode || r.elapsed < 900ms || r.elapsed > 3s) {
        std::cerr << "[timeout] single call elapsed="
                  << std::chrono::duration_cast<std::chrono::milliseconds>(r.elapsed).count() << "ms\n";
        return false;
    }
    return true;
}

/// 풀에 남은 연결을 서버가 몰래 닫았으면 새 연결로 대체해 성공한다.
bool test_stale_pooled_connection_replaced() {
    HttpTestServer server(200, "ok", HttpTestServer::Mode::CloseAfterReply);

    TargetConfig target{};
    target.url = server.url();
    target.timeout = 5s;

    auto client = std::make_shared<HttpClient>(1, target.timeout);
    HttpExecutor exec(client, 0, target, HttpProtocol{});

    for (int i = 0; i < 3; ++i) {
        const auto r = exec.execute();
        if (!r.success) {
            std::cerr << "[stale] call " << i << " failed: " << r.error.value_or("") << "\n";
            return false;
        }
    }
    if (client->connectionsOpened() != 3 || server.requestsServed() != 3) {
        std::cerr << "[stale] opened=" << client->connectionsOpened() << " served=" << server.requestsServed()
                  << "\n";
        return false;
    }
    return true;
}

/// POST는 읽기 단계에서 끊긴 재사용 연결을 다시 보내지 않는다 (중복 전송 방지).
bool test_post_not_resent_after_read_failure() {
    HttpTestServer server(200, "ok", HttpTestServer::Mode::CloseAfterReply);

    TargetConfig target{};
    target.url = server.url();
    target.timeout = 5s;
    target.body = "order=1";

    auto client = std::make_shared<HttpClient>(1, target.timeout);
    HttpExecutor exec(client, 0, target, HttpProtocol{hyperload::protocol::HttpMethod::Post, "POST"});

    const auto first = exec.execute();
    const auto second = exec.execute();
    const auto third = exec.execute();

    if (!first.success || second.success || second.statusCode ||
        second.error.value_or("").rfind("read: ", 0) != 0) {
        std::cerr << "[post] second call should fail at read: '" << second.error.value_or("") << "'\n";
        return false;
    }
    if (server.requestsServed() != 2 || !third.success || client->connectionsOpened() != 2) {
        std::cerr << "[post] served=" << server.requestsServed() << " opened=" << client->connectionsOpened()
                  << "\n";
        return false;
    }
    return true;
}

bool test_invalid_url_and_status_text() {
    TargetConfig target{};
    target.url = "ws://127.0.0.1:1/";
    auto client = std::make_shared<HttpClient>(1, 1s);
    HttpExecutor exec(client, 0, target, HttpProtocol{});
    const auto r = exec.execute();
    if (r.success || r.statusCode || r.error.value_or("").rfind("invalid url: ", 0) != 0) {
        std::cerr << "[invalid] unexpected result: " << r.error.value_or("") << "\n";
        return false;
    }

    if (HttpExecutor::describeStatus(404, "") != "HTTP status: 404 Not Found" ||
        HttpExecutor::describeStatus(599, "Custom") != "HTTP status: 599 Custom" ||
        HttpExecutor::describeStatus(599, "") != "HTTP status: 599") {
        std::cerr << "[invalid] describeStatus mismatch\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_get_200();
    ok = ok && test_get_500();
    ok = ok && test_unreachable();
    ok = ok && test_unsupported_method_no_network();
    ok = ok && test_keep_alive_reuse_and_request_shape();
    ok = ok && test_head_request();
    ok = ok && test_server_closes_connection();
    ok = ok && test_timeout_while_waiting_for_reply();
    ok = ok && test_stale_pooled_connection_replaced();
    ok = ok && test_post_not_resent_after_read_failure();
    ok = ok && test_invalid_url_and_status_text();

    if (!ok) {
        std::cerr << "HttpExecutor tests FAILED\n";
        return 1;
    }

    std::cout << "HttpExecutor tests PASSED\n";
    return 0;
}
