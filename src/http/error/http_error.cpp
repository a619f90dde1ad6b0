#include "http_error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace http::http_error {
    HttpError::HttpError(long s, std::string u,
                         std::string body,        // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_(std::move(body)) {}

    TransportError::TransportError(std::string u, int code, const std::string &detail)
        : HttpError(0, u, std::string{}, "Request to " + u + " failed: " + detail), code_(code) {}

    RedirectError::RedirectError(std::string u, long s, std::string response_body)
        : HttpError(s, u, std::move(response_body),
                    "Request to " + u + " was redirected (status code " + std::to_string(s) + "). See responseBody for details.") {}

    UnsuccessfulStatusError::UnsuccessfulStatusError(std::string u, long s, std::string error_body)
        : HttpError(s, u, std::move(error_body),
                    "Request to " + u + " failed with status code " + std::to_string(s) + ". See errorBody for details.") {}

    TooManyRedirectsError::TooManyRedirectsError(std::string u, long s, int max_redirects)
        : HttpError(s, u, std::string{},
                    "Request to " + u + " exceeded the limit of " + std::to_string(max_redirects) + " redirects (last status code " +
                        std::to_string(s) + ")."),
          max_redirects_(max_redirects) {}

    const HttpError &as_http_error(const Error &e) {
        return std::visit([](const auto &err) -> const HttpError & { return err; }, e);
    }
}  // namespace http::http_error
