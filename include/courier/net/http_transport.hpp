#pragma once

/// @file http_transport.hpp
/// @brief Bot API transport over HTTP(S)
///
/// Each call opens a connection, sends
/// `POST <path>/bot<token>/<method>` with a JSON body and reads the response.
/// The exchange runs on a private io thread; the awaiting coroutine is
/// resumed on that thread.
///
/// Usage:
/// @code
/// auto transport = std::make_shared<net::http_transport>(net::transport_config::from_env());
/// courier::bot bot(transport);
/// @endcode

#include "transport.hpp"
#include "transport_config.hpp"

#include <courier/coro/promise_base.hpp>
#include <courier/log/macros.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <concepts>
#include <coroutine>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace courier::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace detail {

/// Rendezvous between an in-flight exchange and the coroutine awaiting it
///
/// The awaiting chain is parked on its resume gate. complete() resumes it
/// only after claiming the gate, so a chain its owner already dropped is
/// never touched, and an owner dropping it mid-resume waits for the resume.
struct pending_call {
    std::shared_ptr<coro::detail::resume_gate> gate;
    std::uint64_t ticket = 0;
    std::coroutine_handle<> waiter;
    std::optional<request_result<std::string>> result;

    /// Deliver the outcome
    /// @return false if the awaiting coroutine was dropped; the outcome is discarded
    bool complete(request_result<std::string> outcome) {
        if (!gate->claim(ticket)) {
            return false;
        }
        result.emplace(std::move(outcome));
        waiter.resume();
        gate->release();
        return true;
    }
};

/// Awaiter that launches the exchange when the awaiting coroutine suspends
class call_awaiter {
public:
    call_awaiter(std::shared_ptr<pending_call> state, std::function<void()> launch)
        : state_(std::move(state)), launch_(std::move(launch)) {}

    call_awaiter(const call_awaiter&) = delete;
    call_awaiter& operator=(const call_awaiter&) = delete;

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
        requires std::derived_from<Promise, coro::promise_base>
    void await_suspend(std::coroutine_handle<Promise> awaiter) {
        state_->gate = awaiter.promise().gate();
        state_->waiter = awaiter;
        state_->ticket = state_->gate->park();
        // The coroutine may be resumed (and this awaiter destroyed) on the io
        // thread before launch returns, so nothing here may touch *this after
        auto launch = std::move(launch_);
        launch();
    }

    request_result<std::string> await_resume() {
        return std::move(*state_->result);
    }

private:
    std::shared_ptr<pending_call> state_;
    std::function<void()> launch_;
};

/// One HTTP exchange: resolve, connect, (TLS handshake), write, read
template<bool Secure>
class http_session : public std::enable_shared_from_this<http_session<Secure>> {
public:
    using stream_type = std::conditional_t<Secure,
        beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;

    http_session(asio::io_context& ioc, asio::ssl::context& ssl_ctx,
                 const api_url& url, const transport_config& config,
                 std::string method, http::request<http::string_body> req,
                 std::shared_ptr<pending_call> call)
        : resolver_(asio::make_strand(ioc))
        , stream_(make_stream(ioc, ssl_ctx))
        , host_(url.host)
        , port_(std::to_string(url.effective_port()))
        , verify_certificate_(config.verify_certificate)
        , connect_timeout_(config.connect_timeout)
        , request_timeout_(config.request_timeout)
        , method_(std::move(method))
        , req_(std::move(req))
        , call_(std::move(call)) {}

    void run() {
        resolver_.async_resolve(host_, port_,
            beast::bind_front_handler(&http_session::on_resolve, this->shared_from_this()));
    }

private:
    static stream_type make_stream(asio::io_context& ioc, asio::ssl::context& ssl_ctx) {
        if constexpr (Secure) {
            return stream_type(asio::make_strand(ioc), ssl_ctx);
        } else {
            (void)ssl_ctx;
            return stream_type(asio::make_strand(ioc));
        }
    }

    void on_resolve(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
        if (ec) {
            return fail(ec, "resolve");
        }

        beast::get_lowest_layer(stream_).expires_after(connect_timeout_);
        beast::get_lowest_layer(stream_).async_connect(results,
            beast::bind_front_handler(&http_session::on_connect, this->shared_from_this()));
    }

    void on_connect(beast::error_code ec, asio::ip::tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return fail(ec, "connect");
        }

        if constexpr (Secure) {
            // Set SNI Hostname (many hosts need this to handshake successfully)
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
                ec = beast::error_code{static_cast<int>(::ERR_get_error()),
                                       asio::error::get_ssl_category()};
                return fail(ec, "sni");
            }
            if (verify_certificate_) {
                stream_.set_verify_callback(asio::ssl::host_name_verification(host_));
            }
            beast::get_lowest_layer(stream_).expires_after(connect_timeout_);
            stream_.async_handshake(asio::ssl::stream_base::client,
                beast::bind_front_handler(&http_session::on_handshake, this->shared_from_this()));
        } else {
            do_write();
        }
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            return fail(ec, "handshake");
        }
        do_write();
    }

    void do_write() {
        beast::get_lowest_layer(stream_).expires_after(request_timeout_);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&http_session::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail(ec, "write");
        }
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&http_session::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail(ec, "read");
        }

        COURIER_LOG_DEBUG("{} answered {} ({} bytes)", method_, res_.result_int(), res_.body().size());

        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);

        deliver(request_result<std::string>(std::move(res_.body())));
    }

    void fail(beast::error_code ec, const char* what) {
        // The target contains the token; only the method name is logged
        COURIER_LOG_ERROR("{} to {} failed during {}: {}", method_, host_, what, ec.message());
        deliver(request_result<std::string>(request_error::network_failure(
            fmt::format("{}: {}", what, ec.message()))));
    }

    void deliver(request_result<std::string> outcome) {
        if (!call_->complete(std::move(outcome))) {
            COURIER_LOG_DEBUG("{} finished after its future was dropped", method_);
        }
    }

    asio::ip::tcp::resolver resolver_;
    stream_type stream_;
    beast::flat_buffer buffer_;
    std::string host_;
    std::string port_;
    bool verify_certificate_;
    std::chrono::seconds connect_timeout_;
    std::chrono::seconds request_timeout_;
    std::string method_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    std::shared_ptr<pending_call> call_;
};

/// io_context and TLS context shared with the io thread
struct io_runtime {
    asio::io_context ioc;
    asio::ssl::context ssl_ctx{asio::ssl::context::tls_client};
    asio::executor_work_guard<asio::io_context::executor_type> work{ioc.get_executor()};
};

} // namespace detail

/// Transport performing Bot API calls over HTTP(S)
class http_transport final : public transport {
public:
    /// @throws std::invalid_argument if `config.api_url` is not an http(s) URL
    explicit http_transport(transport_config config)
        : config_(std::move(config))
        , runtime_(std::make_shared<detail::io_runtime>()) {
        auto url = api_url::parse(config_.api_url);
        if (!url) {
            throw std::invalid_argument("invalid api url: " + config_.api_url);
        }
        url_ = std::move(*url);

        runtime_->ssl_ctx.set_default_verify_paths();
        runtime_->ssl_ctx.set_verify_mode(config_.verify_certificate
            ? asio::ssl::verify_peer : asio::ssl::verify_none);

        // The thread keeps the runtime alive until run() returns
        thread_ = std::thread([rt = runtime_] { rt->ioc.run(); });
        COURIER_LOG_INFO("http transport started for {}", url_.authority());
    }

    ~http_transport() override {
        runtime_->work.reset();
        runtime_->ioc.stop();
        if (thread_.get_id() == std::this_thread::get_id()) {
            // Last reference dropped from a completion on the io thread
            thread_.detach();
        } else if (thread_.joinable()) {
            thread_.join();
        }
    }

    http_transport(const http_transport&) = delete;
    http_transport& operator=(const http_transport&) = delete;

    coro::task<request_result<std::string>> call(std::string method, std::string body) override {
        auto state = std::make_shared<detail::pending_call>();
        auto req = make_request(method, std::move(body));
        co_return co_await detail::call_awaiter(state,
            [this, state, method = std::move(method), req = std::move(req)]() mutable {
                start(std::move(method), std::move(req), state);
            });
    }

    [[nodiscard]] const api_url& url() const noexcept { return url_; }

private:
    http::request<http::string_body> make_request(const std::string& method, std::string body) const {
        http::request<http::string_body> req{http::verb::post,
            fmt::format("{}/bot{}/{}", url_.path, config_.token, method), 11};
        req.set(http::field::host, url_.authority());
        req.set(http::field::user_agent, config_.user_agent);
        req.set(http::field::content_type, "application/json");
        req.body() = std::move(body);
        req.prepare_payload();
        return req;
    }

    void start(std::string method, http::request<http::string_body> req,
               std::shared_ptr<detail::pending_call> call) {
        if (url_.is_secure()) {
            std::make_shared<detail::http_session<true>>(runtime_->ioc, runtime_->ssl_ctx, url_, config_,
                std::move(method), std::move(req), std::move(call))->run();
        } else {
            std::make_shared<detail::http_session<false>>(runtime_->ioc, runtime_->ssl_ctx, url_, config_,
                std::move(method), std::move(req), std::move(call))->run();
        }
    }

    transport_config config_;
    api_url url_;
    std::shared_ptr<detail::io_runtime> runtime_;
    std::thread thread_;
};

} // namespace courier::net
