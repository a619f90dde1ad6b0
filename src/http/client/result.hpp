#ifndef COURIER_RESULT_HPP
#define COURIER_RESULT_HPP

#include <string>
#include <variant>

#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {
    /**
     * Outcome of one request execution: either the final Response or the typed failure.
     * Callers branch on the error alternative, e.g. std::get_if<UnsuccessfulStatusError>(&result.error()).
     */
    class Result {
       public:
        static Result success(http::model::Response response);
        static Result failure(http::http_error::Error error);

        [[nodiscard]] bool is_success() const { return std::holds_alternative<http::model::Response>(value_); }
        [[nodiscard]] bool is_failure() const { return !is_success(); }
        explicit operator bool() const { return is_success(); }

        // Both accessors throw std::bad_variant_access when called on the wrong alternative.
        [[nodiscard]] const http::model::Response& response() const;
        [[nodiscard]] const http::http_error::Error& error() const;

        // Throws the concrete error type on failure.
        [[nodiscard]] http::model::Response get_or_throw() const;

        [[nodiscard]] std::string error_message() const;

       private:
        explicit Result(std::variant<http::model::Response, http::http_error::Error> value);

        std::variant<http::model::Response, http::http_error::Error> value_;
    };
}  // namespace http::client

#endif
