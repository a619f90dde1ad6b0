#ifndef COURIER_CURL_GLOBAL_HPP
#define COURIER_CURL_GLOBAL_HPP

#include <memory>

namespace http::client {

    // Process-wide libcurl init/cleanup. Share one instance through acquire().
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        // Returns the live instance, creating it if no holder remains.
        static std::shared_ptr<CurlGlobal> acquire();

        // Throws std::runtime_error unless the linked libcurl runs TLS through OpenSSL.
        void require_openssl_backend() const;
    };

    // True for the active backend names that accept CURLOPT_SSL_CTX_FUNCTION.
    // A parenthesized name is an inactive backend in a multi-SSL build.
    [[nodiscard]] bool supports_ssl_ctx_hook(const char* ssl_version);

}  // namespace http::client

#endif
