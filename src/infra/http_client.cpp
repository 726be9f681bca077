#include "dentassist/infra/http_client.hpp"
#include "dentassist/core/logger.hpp"

#include <httplib.h>

#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace dentassist::infra {

namespace {

auto describe(httplib::Error err) -> std::string {
    switch (err) {
        case httplib::Error::Connection: return "Connection failed";
        case httplib::Error::BindIPAddress: return "Bind IP address failed";
        case httplib::Error::Read: return "Read error";
        case httplib::Error::Write: return "Write error";
        case httplib::Error::ExceedRedirectCount: return "Exceeded redirect count";
        case httplib::Error::Canceled: return "Request canceled";
        case httplib::Error::SSLConnection: return "SSL connection error";
        case httplib::Error::SSLLoadingCerts: return "SSL certificate loading error";
        case httplib::Error::SSLServerVerification: return "SSL server verification failed";
        default: return "httplib error " + std::to_string(static_cast<int>(err));
    }
}

auto to_http_response(const httplib::Result& result)
    -> dentassist::Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        if (err == httplib::Error::ConnectionTimeout) {
            return std::unexpected(
                dentassist::make_error(ErrorCode::Timeout,
                                       "HTTP request timed out",
                                       "Connection timeout"));
        }
        return std::unexpected(
            dentassist::make_error(ErrorCode::ConnectionFailed,
                                   "HTTP request failed", describe(err)));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

struct PendingRequest {
    std::string path;
    std::string body;
    std::string content_type;
    httplib::Headers headers;
};

} // anonymous namespace

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    auto merge_headers(const std::map<std::string, std::string>& extra) const
        -> httplib::Headers {
        httplib::Headers hdrs;
        for (const auto& [k, v] : config.default_headers) {
            if (!extra.contains(k)) hdrs.emplace(k, v);
        }
        for (const auto& [k, v] : extra) {
            hdrs.emplace(k, v);
        }
        return hdrs;
    }

    auto perform(PendingRequest request)
        -> boost::asio::awaitable<dentassist::Result<HttpResponse>>;
};

auto HttpClient::Impl::perform(PendingRequest request)
    -> boost::asio::awaitable<dentassist::Result<HttpResponse>> {
    // Shared state between the background thread and the coroutine.
    struct State {
        std::mutex mtx;
        std::optional<dentassist::Result<HttpResponse>> result;
    };

    auto state = std::make_shared<State>();
    auto timer = std::make_shared<boost::asio::steady_timer>(
        ioc, boost::asio::steady_timer::time_point::max());

    std::thread([state, timer, request = std::move(request),
                 base_url = config.base_url,
                 timeout = config.timeout_seconds,
                 verify_ssl = config.verify_ssl]() {
        LOG_DEBUG("POST {}{}", base_url, request.path);

        // httplib::Client is not thread-safe; every request gets its own.
        httplib::Client client(base_url);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);
        if (!verify_ssl) {
            client.enable_server_certificate_verification(false);
        }

        httplib::Result res = client.Post(request.path, request.headers, request.body,
                                          request.content_type);

        auto result = to_http_response(res);
        {
            std::lock_guard lock(state->mtx);
            state->result = std::move(result);
        }
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    }).detach();

    boost::system::error_code ec;
    co_await timer->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    std::lock_guard lock(state->mtx);
    if (!state->result.has_value()) {
        // Timer was cancelled by io_context shutdown, not by the worker.
        co_return std::unexpected(
            dentassist::make_error(ErrorCode::ConnectionClosed,
                                   "HTTP request was cancelled",
                                   ec.message()));
    }
    co_return std::move(*state->result);
}

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<dentassist::Result<HttpResponse>> {
    co_return co_await impl_->perform(PendingRequest{
        .path = std::string(path),
        .body = std::string(body),
        .content_type = std::string(content_type),
        .headers = impl_->merge_headers(headers),
    });
}

void HttpClient::set_default_header(std::string key, std::string value) {
    impl_->config.default_headers[std::move(key)] = std::move(value);
}

} // namespace dentassist::infra
