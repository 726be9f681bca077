#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "dentassist/core/error.hpp"

namespace dentassist::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
///
/// Each request runs the blocking httplib call on its own background thread
/// with a fresh httplib::Client, and the awaiting coroutine is resumed through
/// a steady_timer on the io_context. The io_context thread is never blocked,
/// so callers can race a request against their own deadline.
class HttpClient {
public:
    explicit HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Performs an asynchronous HTTP POST request.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<dentassist::Result<HttpResponse>>;

    /// Sets a default header that will be sent with every request.
    void set_default_header(std::string key, std::string value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dentassist::infra
