#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logger.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../security/trust_aggregator.hpp"
#include "../security/trust_store.hpp"
#include "curl_easy.hpp"

namespace http::client {
    namespace {
        const long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
        const long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
        const long HTTP_REDIRECT_UPPER_BOUNDARY = 400;

        struct HeaderNames {
            static constexpr const char* ACCEPT = "Accept";
            static constexpr const char* CONTENT_TYPE = "Content-Type";
            static constexpr const char* LOCATION = "Location";
            static constexpr const char* EXPECT = "Expect";
        };

        struct CurlUrlDeleter {
            void operator()(CURLU* u) const { curl_url_cleanup(u); }
        };

        bool is_request_successful(long code) { return code >= HTTP_SUCCESS_LOWER_BOUNDARY && code < HTTP_SUCCESS_UPPER_BOUNDARY; }

        bool is_redirect(long code) { return code >= HTTP_SUCCESS_UPPER_BOUNDARY && code < HTTP_REDIRECT_UPPER_BOUNDARY; }

        bool is_secure(const std::string& url) { return string_utils::ieq_prefix(url.c_str(), url.size(), "https://"); }

        std::unique_ptr<http::security::SslSocketFactory> build_ssl_socket_factory(const http::configuration::HttpClientConfiguration& configuration) {
            std::vector<http::security::TrustStore> stores;
            if (configuration.certificate()) {
                stores.push_back(http::security::load_trust_store(*configuration.certificate()));
            }
            auto aggregator = std::make_unique<http::security::TrustAggregator>(std::move(stores));
            return std::make_unique<http::security::SslSocketFactory>(std::move(aggregator));
        }

        // libcurl drops a "Name:" line with an empty value; "Name;" sends it empty.
        std::string header_line(const std::string& name, const std::string& value) {
            if (value.empty()) {
                return name + ";";
            }
            return name + ": " + value;
        }

        std::vector<std::string> build_header_lines(const http::model::Request& request, bool has_body) {
            std::vector<std::string> lines;
            lines.reserve(request.headers_.size() + 3);
            lines.push_back(header_line(HeaderNames::ACCEPT, constants::JSON_MEDIA_TYPE));

            for (const auto& header : request.headers_) {
                // A body always goes out as JSON; the caller's Content-Type is replaced.
                if (has_body && string_utils::ieq(header.name(), HeaderNames::CONTENT_TYPE)) {
                    continue;
                }
                lines.push_back(header_line(header.name(), header.value()));
            }

            if (has_body) {
                lines.push_back(header_line(HeaderNames::CONTENT_TYPE, constants::JSON_CONTENT_TYPE));
                lines.push_back(std::string(HeaderNames::EXPECT) + ":");  // no 100-continue round trip
            }
            return lines;
        }

        // Location may be relative; resolve it against the URL that produced it.
        std::string resolve_location(const std::string& base, const std::string& location) {
            std::unique_ptr<CURLU, CurlUrlDeleter> url(curl_url());
            if (!url || curl_url_set(url.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK ||
                curl_url_set(url.get(), CURLUPART_URL, location.c_str(), 0) != CURLUE_OK) {
                return location;
            }

            char* resolved = nullptr;
            if (curl_url_get(url.get(), CURLUPART_URL, &resolved, 0) != CURLUE_OK || resolved == nullptr) {
                return location;
            }
            std::string out(resolved);
            curl_free(resolved);
            return out;
        }
    }  // namespace

    HttpClient::HttpClient() : HttpClient(http::configuration::HttpClientConfiguration::builder().build()) {}

    HttpClient::HttpClient(http::configuration::HttpClientConfiguration configuration)
        : configuration_(std::move(configuration)), curl_global_(CurlGlobal::acquire()), ssl_socket_factory_(build_ssl_socket_factory(configuration_)) {
        curl_global_->require_openssl_backend();
    }

    void HttpClient::add_request_interceptor(std::shared_ptr<http::interceptor::RequestInterceptor> interceptor) {
        interceptors_.add(std::move(interceptor));
    }

    bool HttpClient::remove_request_interceptor(const std::shared_ptr<http::interceptor::RequestInterceptor>& interceptor) {
        return interceptors_.remove(interceptor);
    }

    void HttpClient::remove_all_request_interceptors() { interceptors_.clear(); }

    Result HttpClient::execute_get_request(http::model::GetRequest& request) { return execute(request); }

    Result HttpClient::execute_post_request(http::model::PostRequest& request) { return execute(request); }

    Result HttpClient::execute_put_request(http::model::PutRequest& request) { return execute(request); }

    Result HttpClient::execute_delete_request(http::model::DeleteRequest& request) { return execute(request); }

    Result HttpClient::execute_head_request(http::model::HeadRequest& request) { return execute(request); }

    Result HttpClient::execute_options_request(http::model::OptionsRequest& request) { return execute(request); }

    Result HttpClient::execute_patch_request(http::model::PatchRequest& request) { return execute(request); }

    Result HttpClient::execute(http::model::Request& request) { return execute_hop(request, 0); }

    Result HttpClient::execute_hop(http::model::Request& request, int redirects_followed) {
        // Interceptor exceptions are deliberately not caught.
        interceptors_.apply(request);

        RawResponse raw;
        try {
            raw = dispatch(request);
        } catch (const CurlError& e) {
            COURIER_LOG_WARN(http::model::to_string(request.method()) << " " << request.url_ << " failed: " << e.what());
            return Result::failure(http::http_error::TransportError(request.url_, static_cast<int>(e.code_), e.what()));
        }

        COURIER_LOG_DEBUG(http::model::to_string(request.method()) << " " << request.url_ << " -> " << raw.status_);

        if (is_request_successful(raw.status_)) {
            return Result::success(http::model::Response(raw.status_, std::move(raw.body_), std::move(raw.headers_)));
        }

        if (is_redirect(raw.status_)) {
            if (configuration_.follow_redirects()) {
                return follow_redirect(request, raw.status_, raw.headers_, redirects_followed);
            }
            return Result::failure(http::http_error::RedirectError(request.url_, raw.status_, std::move(raw.body_)));
        }

        return Result::failure(http::http_error::UnsuccessfulStatusError(request.url_, raw.status_, std::move(raw.body_)));
    }

    RawResponse HttpClient::dispatch(const http::model::Request& request) const {
        const auto* with_body = dynamic_cast<const http::model::RequestWithBody*>(&request);

        // Released on every path out of this scope, before any redirect is followed.
        CurlEasy connection;
        connection.set_url(request.url_);
        if (is_secure(request.url_)) {
            connection.set_ssl_socket_factory(ssl_socket_factory_.get());
        }
        connection.set_timeouts(configuration_.read_timeout(), configuration_.connect_timeout());
        connection.set_method(request.method());
        connection.set_headers(build_header_lines(request, with_body != nullptr));
        if (with_body != nullptr) {
            connection.set_body(with_body->body_);
        }

        return connection.perform();
    }

    Result HttpClient::follow_redirect(const http::model::Request& request, long status, const http::model::HeaderMap& headers, int redirects_followed) {
        auto location = headers.find(HeaderNames::LOCATION);
        if (location == headers.end() || location->second.empty()) {
            return Result::failure(http::http_error::RedirectError(request.url_, status, constants::NO_LOCATION_HEADER));
        }

        if (redirects_followed >= configuration_.max_redirects()) {
            COURIER_LOG_WARN("Redirect limit of " << configuration_.max_redirects() << " reached at " << request.url_);
            return Result::failure(http::http_error::TooManyRedirectsError(request.url_, status, configuration_.max_redirects()));
        }

        http::model::GetRequest next(resolve_location(request.url_, location->second));
        next.headers_ = request.headers_;

        COURIER_LOG_DEBUG("Following " << status << " redirect from " << request.url_ << " to " << next.url_);
        return execute_hop(next, redirects_followed + 1);
    }
}  // namespace http::client
