#include "result.hpp"

#include <string>
#include <utility>
#include <variant>

namespace http::client {
    Result::Result(std::variant<http::model::Response, http::http_error::Error> value) : value_(std::move(value)) {}

    Result Result::success(http::model::Response response) {
        return Result(std::variant<http::model::Response, http::http_error::Error>(std::in_place_index<0>, std::move(response)));
    }

    Result Result::failure(http::http_error::Error error) {
        return Result(std::variant<http::model::Response, http::http_error::Error>(std::in_place_index<1>, std::move(error)));
    }

    const http::model::Response& Result::response() const { return std::get<http::model::Response>(value_); }

    const http::http_error::Error& Result::error() const { return std::get<http::http_error::Error>(value_); }

    http::model::Response Result::get_or_throw() const {
        if (is_failure()) {
            std::visit([](const auto& err) { throw err; }, error());
        }
        return response();
    }

    std::string Result::error_message() const {
        if (is_success()) {
            return {};
        }
        return http::http_error::as_http_error(error()).what();
    }
}  // namespace http::client
