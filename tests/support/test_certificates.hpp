#ifndef COURIER_TEST_CERTIFICATES_HPP
#define COURIER_TEST_CERTIFICATES_HPP

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>
#include <optional>
#include <string>

#include "../../src/http/security/certificate.hpp"

namespace test_support {
    struct EvpPkeyDeleter {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };
    using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

    // Certificate plus its private key, generated at runtime (EC P-256, SHA-256).
    struct Identity {
        http::security::Certificate cert_;
        EvpPkeyPtr key_;

        [[nodiscard]] std::string cert_pem() const;
        [[nodiscard]] std::string cert_der() const;
    };

    Identity make_self_signed(const std::string& common_name, const std::optional<std::string>& ip_san = std::nullopt);
    Identity make_signed_by(const std::string& common_name, const Identity& issuer, const std::optional<std::string>& ip_san = std::nullopt);
}  // namespace test_support

#endif
