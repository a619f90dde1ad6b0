#ifndef COURIER_HTTP_CLIENT_HPP
#define COURIER_HTTP_CLIENT_HPP

#include <memory>

#include "../configuration/configuration.hpp"
#include "../interceptor/interceptor.hpp"
#include "../model/model.hpp"
#include "../security/ssl_socket_factory.hpp"
#include "curl_easy.hpp"
#include "curl_global.hpp"
#include "interface.hpp"
#include "result.hpp"

namespace http::client {
    /**
     * Synchronous HTTP client.
     *
     * Each execute() call blocks the calling thread and uses its own connection, so one client
     * may be shared by several threads. TLS trust (system roots plus the configured certificate)
     * is prepared once in the constructor; an unparsable certificate throws
     * http::security::CertificateError from there.
     *
     * Failures come back inside the Result; only exceptions thrown by interceptors escape.
     */
    class HttpClient : public IHttpClient {
       public:
        HttpClient();
        explicit HttpClient(http::configuration::HttpClientConfiguration configuration);

        ~HttpClient() override = default;
        HttpClient(const HttpClient&) = delete;
        HttpClient& operator=(const HttpClient&) = delete;
        HttpClient(HttpClient&&) = delete;
        HttpClient& operator=(HttpClient&&) = delete;

        void add_request_interceptor(std::shared_ptr<http::interceptor::RequestInterceptor> interceptor);
        bool remove_request_interceptor(const std::shared_ptr<http::interceptor::RequestInterceptor>& interceptor);
        void remove_all_request_interceptors();

        Result execute_get_request(http::model::GetRequest& request);
        Result execute_post_request(http::model::PostRequest& request);
        Result execute_put_request(http::model::PutRequest& request);
        Result execute_delete_request(http::model::DeleteRequest& request);
        Result execute_head_request(http::model::HeadRequest& request);
        Result execute_options_request(http::model::OptionsRequest& request);
        Result execute_patch_request(http::model::PatchRequest& request);

        Result execute(http::model::Request& request) override;

        [[nodiscard]] const http::configuration::HttpClientConfiguration& configuration() const { return configuration_; }
        [[nodiscard]] const http::security::TrustAggregator& trust_aggregator() const { return ssl_socket_factory_->aggregator(); }

       private:
        Result execute_hop(http::model::Request& request, int redirects_followed);
        RawResponse dispatch(const http::model::Request& request) const;
        Result follow_redirect(const http::model::Request& request, long status, const http::model::HeaderMap& headers, int redirects_followed);

        http::configuration::HttpClientConfiguration configuration_;
        std::shared_ptr<CurlGlobal> curl_global_;
        std::unique_ptr<http::security::SslSocketFactory> ssl_socket_factory_;
        http::interceptor::InterceptorChain interceptors_;
    };
}  // namespace http::client

#endif
