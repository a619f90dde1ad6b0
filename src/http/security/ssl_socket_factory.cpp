#include "ssl_socket_factory.hpp"

#include <curl/curl.h>
#include <openssl/objects.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <string>
#include <string_view>
#include <utility>

#include "../../utils/logger.hpp"

namespace http::security {
    namespace {
        constexpr const char* UNKNOWN_AUTH_TYPE = "UNKNOWN";

        std::string strip_prefix(const char* name, std::string_view prefix) {
            std::string_view sv = name != nullptr ? name : "";
            if (sv.substr(0, prefix.size()) == prefix) {
                sv.remove_prefix(prefix.size());
            }
            return std::string(sv);
        }

        // "ECDHE_RSA" style name of the negotiated key exchange and authentication.
        std::string negotiated_auth_type(X509_STORE_CTX* store_ctx) {
            auto* ssl = static_cast<SSL*>(X509_STORE_CTX_get_ex_data(store_ctx, SSL_get_ex_data_X509_STORE_CTX_idx()));
            if (ssl == nullptr) {
                return UNKNOWN_AUTH_TYPE;
            }
            const SSL_CIPHER* cipher = SSL_get_pending_cipher(ssl);
            if (cipher == nullptr) {
                cipher = SSL_get_current_cipher(ssl);
            }
            if (cipher == nullptr) {
                return UNKNOWN_AUTH_TYPE;
            }
            const std::string kx = strip_prefix(OBJ_nid2sn(SSL_CIPHER_get_kx_nid(cipher)), "Kx");
            const std::string auth = strip_prefix(OBJ_nid2sn(SSL_CIPHER_get_auth_nid(cipher)), "Auth");
            return kx + "_" + auth;
        }
    }  // namespace

    SslSocketFactory::SslSocketFactory(std::unique_ptr<TrustAggregator> aggregator) : aggregator_(std::move(aggregator)) {}

    CURLcode SslSocketFactory::install(CURL* /*curl*/, void* ssl_ctx, void* userptr) {
        auto* ctx = static_cast<SSL_CTX*>(ssl_ctx);
        SSL_CTX_set_cert_verify_callback(ctx, &SslSocketFactory::verify_chain, userptr);
        return CURLE_OK;
    }

    int SslSocketFactory::verify_chain(X509_STORE_CTX* store_ctx, void* arg) {
        const auto* self = static_cast<const SslSocketFactory*>(arg);
        X509* leaf = X509_STORE_CTX_get0_cert(store_ctx);
        if (self == nullptr || leaf == nullptr) {
            X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_UNSPECIFIED);
            return 0;
        }

        // Exceptions must not unwind through OpenSSL.
        try {
            CertificateChain chain;
            chain.push_back(Certificate::borrow(leaf));

            // OpenSSL passes the whole peer chain, leaf included, as the untrusted set.
            STACK_OF(X509)* presented = X509_STORE_CTX_get0_untrusted(store_ctx);
            const int n = presented != nullptr ? sk_X509_num(presented) : 0;
            for (int i = 0; i < n; ++i) {
                X509* cert = sk_X509_value(presented, i);
                if (cert != nullptr && cert != leaf) {
                    chain.push_back(Certificate::borrow(cert));
                }
            }

            self->aggregator_->check_server_trusted(chain, negotiated_auth_type(store_ctx));
            X509_STORE_CTX_set_error(store_ctx, X509_V_OK);
            return 1;
        } catch (const TrustFailure& e) {
            COURIER_LOG_DEBUG("TLS handshake rejected: " << e.what());
            X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_CERT_UNTRUSTED);
        } catch (const std::exception& e) {
            COURIER_LOG_WARN("TLS chain verification failed: " << e.what());
            X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_UNSPECIFIED);
        }
        return 0;
    }
}  // namespace http::security
