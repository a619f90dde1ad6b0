#ifndef COURIER_TRUST_STORE_HPP
#define COURIER_TRUST_STORE_HPP

#include <openssl/x509_vfy.h>

#include <string_view>
#include <vector>

#include "certificate.hpp"

namespace http::security {
    // Owning handle to an OpenSSL X509_STORE holding trust anchors.
    class TrustStore {
       public:
        TrustStore();

        ~TrustStore();
        TrustStore(const TrustStore&) = delete;
        TrustStore& operator=(const TrustStore&) = delete;
        TrustStore(TrustStore&& other) noexcept;
        TrustStore& operator=(TrustStore&& other) noexcept;

        // The platform's default CA locations (OpenSSL default file and directory).
        static TrustStore system_default();

        void add(const Certificate& cert);

        // Certificates currently loaded into the store. Directory lookups are lazy and not listed.
        [[nodiscard]] std::vector<Certificate> certificates() const;

        [[nodiscard]] X509_STORE* native() const { return store_; }

       private:
        X509_STORE* store_;
    };

    // Parses one X.509 certificate (PEM or DER) into a fresh store. Throws CertificateError.
    TrustStore load_trust_store(std::string_view certificate_bytes);
}  // namespace http::security

#endif
