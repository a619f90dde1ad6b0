#ifndef COURIER_HTTP_ERROR_HPP
#define COURIER_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>
#include <variant>

namespace http::http_error {
    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_;
        explicit HttpError(long s, std::string u, std::string body, const std::string &msg);
    };

    // Network or I/O failure (DNS, connect, TLS handshake, timeout, stream). Status is always 0.
    struct TransportError : public HttpError {
        int code_;
        explicit TransportError(std::string u, int code, const std::string &detail);
    };

    // 3xx without a Location header, or any 3xx while redirect following is disabled.
    struct RedirectError : public HttpError {
        explicit RedirectError(std::string u, long s, std::string response_body);
        [[nodiscard]] const std::string &response_body() const { return body_; }
    };

    struct UnsuccessfulStatusError : public HttpError {
        explicit UnsuccessfulStatusError(std::string u, long s, std::string error_body);
        [[nodiscard]] const std::string &error_body() const { return body_; }
    };

    struct TooManyRedirectsError : public HttpError {
        int max_redirects_;
        explicit TooManyRedirectsError(std::string u, long s, int max_redirects);
    };

    using Error = std::variant<TransportError, RedirectError, UnsuccessfulStatusError, TooManyRedirectsError>;

    [[nodiscard]] const HttpError &as_http_error(const Error &e);
}  // namespace http::http_error

#endif
