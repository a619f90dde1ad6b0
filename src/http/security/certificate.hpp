#ifndef COURIER_CERTIFICATE_HPP
#define COURIER_CERTIFICATE_HPP

#include <openssl/x509.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace http::security {
    struct CertificateError : public std::runtime_error {
        explicit CertificateError(const std::string& msg);
    };

    // Shared, reference-counted handle to an OpenSSL X509. Copies bump the refcount.
    class Certificate {
       public:
        // Takes ownership of one reference.
        explicit Certificate(X509* cert);

        ~Certificate();
        Certificate(const Certificate& other);
        Certificate& operator=(const Certificate& other);
        Certificate(Certificate&& other) noexcept;
        Certificate& operator=(Certificate&& other) noexcept;

        // Shares the caller's reference instead of taking it over.
        static Certificate borrow(X509* cert);

        // Parses exactly one certificate, PEM first and DER as a fallback. Throws CertificateError.
        static Certificate parse(std::string_view bytes);

        [[nodiscard]] X509* native() const { return cert_; }
        [[nodiscard]] std::string subject() const;
        [[nodiscard]] std::string issuer() const;

       private:
        X509* cert_;
    };

    // Leaf first, then the untrusted intermediates as presented by the peer.
    using CertificateChain = std::vector<Certificate>;

    // Drains the OpenSSL error queue into one line.
    std::string openssl_error_string();
}  // namespace http::security

#endif
