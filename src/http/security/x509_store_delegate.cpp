#include "x509_store_delegate.hpp"

#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace http::security {
    namespace {
        struct StoreCtxDeleter {
            void operator()(X509_STORE_CTX* ctx) const { X509_STORE_CTX_free(ctx); }
        };

        // Elements are borrowed from the chain; only the stack itself is freed.
        struct X509StackDeleter {
            void operator()(STACK_OF(X509) * stack) const { sk_X509_free(stack); }
        };
    }  // namespace

    X509StoreDelegate::X509StoreDelegate(TrustStore store, bool allow_partial_chain)
        : store_(std::move(store)), allow_partial_chain_(allow_partial_chain) {}

    bool X509StoreDelegate::trusts(const CertificateChain& chain, const std::string& /*auth_type*/, TrustRole role) const {
        if (chain.empty()) {
            return false;
        }

        std::unique_ptr<STACK_OF(X509), X509StackDeleter> untrusted(sk_X509_new_null());
        std::unique_ptr<X509_STORE_CTX, StoreCtxDeleter> ctx(X509_STORE_CTX_new());
        if (!untrusted || !ctx) {
            ERR_clear_error();
            return false;
        }

        for (size_t i = 1; i < chain.size(); ++i) {
            if (sk_X509_push(untrusted.get(), chain[i].native()) == 0) {
                ERR_clear_error();
                return false;
            }
        }

        if (X509_STORE_CTX_init(ctx.get(), store_.native(), chain.front().native(), untrusted.get()) != 1) {
            ERR_clear_error();
            return false;
        }

        X509_STORE_CTX_set_purpose(ctx.get(), role == TrustRole::SERVER ? X509_PURPOSE_SSL_SERVER : X509_PURPOSE_SSL_CLIENT);
        if (allow_partial_chain_) {
            X509_STORE_CTX_set_flags(ctx.get(), X509_V_FLAG_PARTIAL_CHAIN);
        }

        const bool ok = X509_verify_cert(ctx.get()) == 1;
        ERR_clear_error();
        return ok;
    }

    std::vector<Certificate> X509StoreDelegate::accepted_issuers() const { return store_.certificates(); }
}  // namespace http::security
