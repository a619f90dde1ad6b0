#include "trust_store.hpp"

#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <utility>
#include <vector>

namespace http::security {
    TrustStore::TrustStore() : store_(X509_STORE_new()) {
        if (store_ == nullptr) {
            throw CertificateError("Failed to create X509 store: " + openssl_error_string());
        }
    }

    TrustStore::~TrustStore() {
        if (store_ != nullptr) {
            X509_STORE_free(store_);
        }
    }

    TrustStore::TrustStore(TrustStore&& other) noexcept : store_(std::exchange(other.store_, nullptr)) {}

    TrustStore& TrustStore::operator=(TrustStore&& other) noexcept {
        if (this != &other) {
            if (store_ != nullptr) {
                X509_STORE_free(store_);
            }
            store_ = std::exchange(other.store_, nullptr);
        }
        return *this;
    }

    TrustStore TrustStore::system_default() {
        TrustStore store;
        // Missing default locations are not an error; the store then trusts nothing.
        if (X509_STORE_set_default_paths(store.store_) != 1) {
            throw CertificateError("Failed to load default trust locations: " + openssl_error_string());
        }
        return store;
    }

    void TrustStore::add(const Certificate& cert) {
        ERR_clear_error();
        if (X509_STORE_add_cert(store_, cert.native()) != 1) {
            throw CertificateError("Failed to add certificate to store: " + openssl_error_string());
        }
    }

    std::vector<Certificate> TrustStore::certificates() const {
        std::vector<Certificate> out;
        // Directory lookups may append to the store during a concurrent verification.
        X509_STORE_lock(store_);
        STACK_OF(X509_OBJECT)* objects = X509_STORE_get0_objects(store_);
        const int n = sk_X509_OBJECT_num(objects);
        for (int i = 0; i < n; ++i) {
            X509* cert = X509_OBJECT_get0_X509(sk_X509_OBJECT_value(objects, i));
            if (cert != nullptr) {
                X509_up_ref(cert);
                out.emplace_back(cert);
            }
        }
        X509_STORE_unlock(store_);
        return out;
    }

    TrustStore load_trust_store(std::string_view certificate_bytes) {
        TrustStore store;
        store.add(Certificate::parse(certificate_bytes));
        return store;
    }
}  // namespace http::security
