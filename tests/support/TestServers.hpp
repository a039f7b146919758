#pragma once

// 네트워크 테스트용 in-process 서버 (loopback, 임시 포트).
// 서버는 자기 스레드에서 io_context를 돌리고, 소멸 시 stop + join 한다.

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace hyperload::test
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = asio::ip::tcp;

/// 바인드했다가 바로 닫은 loopback 포트. 접속하면 connection refused.
inline unsigned short unusedLoopbackPort()
{
    asio::io_context ioc;
    tcp::acceptor acc(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const unsigned short port = acc.local_endpoint().port();
    acc.close();
    return port;
}

/// 마지막으로 받은 HTTP 요청의 요약
struct SeenRequest
{
    std::string method;
    std::string target;
    std::string body;
    std::map<std::string, std::string> headers;
};

/// 모든 요청에 같은 상태 코드/본문으로 응답하는 keep-alive HTTP 서버
class HttpTestServer
{
  public:
    enum class Mode
    {
        Reply,
        NeverReply,      // 요청을 읽기만 하고 응답하지 않는다
        CloseAfterReply, // keep-alive로 응답한 뒤 아무 통보 없이 소켓을 닫는다
    };

    explicit HttpTestServer(unsigned status, std::string body = "ok", Mode mode = Mode::Reply)
        : status_(status), body_(std::move(body)), mode_(mode),
          acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        doAccept_();
        th_ = std::thread([this] { ioc_.run(); });
    }

    ~HttpTestServer()
    {
        ioc_.stop();
        if (th_.joinable())
            th_.join();
    }

    HttpTestServer(const HttpTestServer &) = delete;
    HttpTestServer &operator=(const HttpTestServer &) = delete;

    [[nodiscard]] unsigned short port() const { return acceptor_.local_endpoint().port(); }
    [[nodiscard]] std::string url(std::string_view path = "/") const
    {
        return std::format("http://127.0.0.1:{}{}", port(), path);
    }

    [[nodiscard]] std::size_t requestsServed() const { return served_.load(); }
    [[nodiscard]] std::size_t connectionsAccepted() const { return accepted_.load(); }

    [[nodiscard]] SeenRequest lastRequest()
    {
        std::scoped_lock lk(mu_);
        return last_;
    }

  private:
    class Session : public std::enable_shared_from_this<Session>
    {
      public:
        Session(tcp::socket sock, HttpTestServer &owner) : stream_(std::move(sock)), owner_(owner) {}

        void start() { read_(); }

      private:
        void read_()
        {
            req_ = {};
            http::async_read(stream_, buf_, req_,
                             [self = shared_from_this()](beast::error_code ec, std::size_t) { self->onRead_(ec); });
        }

        void onRead_(beast::error_code ec)
        {
            if (ec)
            {
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
                return;
            }

            {
                SeenRequest seen;
                seen.method = std::string(req_.method_string());
                seen.target = std::string(req_.target());
                seen.body = req_.body();
                for (const auto &f : req_)
                    seen.headers[std::string(f.name_string())] = std::string(f.value());

                std::scoped_lock lk(owner_.mu_);
                owner_.last_ = std::move(seen);
            }
            owner_.served_.fetch_add(1);

            if (owner_.mode_ == Mode::NeverReply)
            {
                read_();
                return;
            }

            res_ = std::make_shared<http::response<http::string_body>>(http::int_to_status(owner_.status_),
                                                                       req_.version());
            res_->result(owner_.status_);
            res_->set(http::field::server, "hyperload-test");
            res_->keep_alive(req_.keep_alive());
            if (req_.method() == http::verb::head)
            {
                res_->content_length(owner_.body_.size());
            }
            else
            {
                res_->body() = owner_.body_;
                res_->prepare_payload();
            }

            http::async_write(stream_, *res_, [self = shared_from_this()](beast::error_code e, std::size_t) {
                self->onWrite_(e);
            });
        }

        void onWrite_(beast::error_code ec)
        {
            if (ec)
                return;
            if (owner_.mode_ == Mode::CloseAfterReply)
            {
                stream_.socket().close(ec);
                return;
            }
            if (!res_->keep_alive())
            {
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
                return;
            }
            read_();
        }

        beast::tcp_stream stream_;
        HttpTestServer &owner_;
        beast::flat_buffer buf_;
        http::request<http::string_body> req_;
        std::shared_ptr<http::response<http::string_body>> res_;
    };

    void doAccept_()
    {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket sock) {
            if (ec)
                return;
            accepted_.fetch_add(1);
            std::make_shared<Session>(std::move(sock), *this)->start();
            doAccept_();
        });
    }

    unsigned status_;
    std::string body_;
    Mode mode_;

    asio::io_context ioc_{1};
    tcp::acceptor acceptor_;
    std::thread th_;

    std::atomic<std::size_t> served_{0};
    std::atomic<std::size_t> accepted_{0};
    std::mutex mu_;
    SeenRequest last_;
};

/// 텍스트 메시지를 세기만 하는 WebSocket 서버. 응답은 보내지 않는다.
class WsTestServer
{
  public:
    enum class Mode
    {
        CountOnly,
        // 핸드셰이크 후 아무것도 읽지 않다가 잠시 뒤 RST로 끊는다 (linger 0)
        AbortAfterHandshake,
    };

    explicit WsTestServer(Mode mode = Mode::CountOnly)
        : mode_(mode), acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        doAccept_();
        th_ = std::thread([this] { ioc_.run(); });
    }

    ~WsTestServer()
    {
        ioc_.stop();
        if (th_.joinable())
            th_.join();
    }

    WsTestServer(const WsTestServer &) = delete;
    WsTestServer &operator=(const WsTestServer &) = delete;

    [[nodiscard]] unsigned short port() const { return acceptor_.local_endpoint().port(); }
    [[nodiscard]] std::string url(std::string_view path = "/") const
    {
        return std::format("ws://127.0.0.1:{}{}", port(), path);
    }

    [[nodiscard]] std::size_t sessionsOpened() const { return opened_.load(); }
    [[nodiscard]] std::size_t sessionsClosed() const { return closed_.load(); }
    [[nodiscard]] std::size_t messagesReceived() const { return messages_.load(); }

    [[nodiscard]] std::string lastMessage()
    {
        std::scoped_lock lk(mu_);
        return lastMessage_;
    }

  private:
    class Session : public std::enable_shared_from_this<Session>
    {
      public:
        Session(tcp::socket sock, WsTestServer &owner)
            : ws_(std::move(sock)), owner_(owner), abortTimer_(ws_.get_executor())
        {
        }

        void start()
        {
            ws_.async_accept([self = shared_from_this()](beast::error_code ec) {
                if (ec)
                    return;
                self->owner_.opened_.fetch_add(1);
                if (self->owner_.mode_ == Mode::AbortAfterHandshake)
                    self->abortLater_();
                else
                    self->read_();
            });
        }

      private:
        void abortLater_()
        {
            abortTimer_.expires_after(std::chrono::milliseconds(200));
            abortTimer_.async_wait([self = shared_from_this()](beast::error_code ec) {
                if (ec)
                    return;
                auto &sock = beast::get_lowest_layer(self->ws_).socket();
                sock.set_option(tcp::socket::linger(true, 0), ec);
                sock.close(ec);
            });
        }

        void read_()
        {
            ws_.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec)
                {
                    // 정상 종료 핸드셰이크는 websocket::error::closed 로 끝난다
                    if (ec == websocket::error::closed)
                        self->owner_.closed_.fetch_add(1);
                    return;
                }

                {
                    std::scoped_lock lk(self->owner_.mu_);
                    self->owner_.lastMessage_ = beast::buffers_to_string(self->buf_.data());
                }
                self->owner_.messages_.fetch_add(1);
                self->buf_.consume(self->buf_.size());
                self->read_();
            });
        }

        websocket::stream<beast::tcp_stream> ws_;
        WsTestServer &owner_;
        asio::steady_timer abortTimer_;
        beast::flat_buffer buf_;
    };

    void doAccept_()
    {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket sock) {
            if (ec)
                return;
            std::make_shared<Session>(std::move(sock), *this)->start();
            doAccept_();
        });
    }

    Mode mode_;
    asio::io_context ioc_{1};
    tcp::acceptor acceptor_;
    std::thread th_;

    std::atomic<std::size_t> opened_{0};
    std::atomic<std::size_t> closed_{0};
    std::atomic<std::size_t> messages_{0};
    std::mutex mu_;
    std::string lastMessage_;
};

} // namespace hyperload::test
