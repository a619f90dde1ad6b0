#ifndef COURIER_SSL_SOCKET_FACTORY_HPP
#define COURIER_SSL_SOCKET_FACTORY_HPP

#include <curl/curl.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include <memory>

#include "trust_aggregator.hpp"

namespace http::security {
    /**
     * Hooks a TrustAggregator into the OpenSSL context libcurl builds for each secure connection.
     *
     * Register install() as CURLOPT_SSL_CTX_FUNCTION with the factory as CURLOPT_SSL_CTX_DATA.
     * Chain verification is then delegated to the aggregator (server role); hostname checks
     * stay with libcurl.
     */
    class SslSocketFactory {
       public:
        explicit SslSocketFactory(std::unique_ptr<TrustAggregator> aggregator);

        ~SslSocketFactory() = default;
        SslSocketFactory(const SslSocketFactory&) = delete;
        SslSocketFactory& operator=(const SslSocketFactory&) = delete;
        SslSocketFactory(SslSocketFactory&&) = delete;
        SslSocketFactory& operator=(SslSocketFactory&&) = delete;

        static CURLcode install(CURL* curl, void* ssl_ctx, void* userptr);

        [[nodiscard]] const TrustAggregator& aggregator() const { return *aggregator_; }

       private:
        static int verify_chain(X509_STORE_CTX* store_ctx, void* arg);

        std::unique_ptr<TrustAggregator> aggregator_;
    };
}  // namespace http::security

#endif
