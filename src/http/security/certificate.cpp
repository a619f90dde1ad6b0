#include "certificate.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <array>
#include <climits>
#include <memory>
#include <string>
#include <utility>

namespace http::security {
    namespace {
        const size_t OPENSSL_ERROR_BUFFER_SIZE = 256;

        struct BioDeleter {
            void operator()(BIO* bio) const { BIO_free(bio); }
        };
        using BioPtr = std::unique_ptr<BIO, BioDeleter>;

        BioPtr make_mem_bio(std::string_view bytes) {
            BioPtr bio(BIO_new_mem_buf(bytes.data(), static_cast<int>(bytes.size())));
            if (!bio) {
                throw CertificateError("Failed to allocate certificate buffer: " + openssl_error_string());
            }
            return bio;
        }

        std::string name_to_string(const X509_NAME* name) {
            if (name == nullptr) {
                return {};
            }
            BioPtr out(BIO_new(BIO_s_mem()));
            if (!out || X509_NAME_print_ex(out.get(), name, 0, XN_FLAG_RFC2253) < 0) {
                return {};
            }
            char* data = nullptr;
            const long len = BIO_get_mem_data(out.get(), &data);
            return {data, static_cast<size_t>(len)};
        }
    }  // namespace

    CertificateError::CertificateError(const std::string& msg) : std::runtime_error(msg) {}

    Certificate::Certificate(X509* cert) : cert_(cert) {
        if (cert_ == nullptr) {
            throw CertificateError("Null certificate");
        }
    }

    Certificate::~Certificate() {
        if (cert_ != nullptr) {
            X509_free(cert_);
        }
    }

    Certificate::Certificate(const Certificate& other) : cert_(other.cert_) {
        if (cert_ != nullptr) {
            X509_up_ref(cert_);
        }
    }

    Certificate& Certificate::operator=(const Certificate& other) {
        if (this != &other) {
            if (other.cert_ != nullptr) {
                X509_up_ref(other.cert_);
            }
            if (cert_ != nullptr) {
                X509_free(cert_);
            }
            cert_ = other.cert_;
        }
        return *this;
    }

    Certificate::Certificate(Certificate&& other) noexcept : cert_(std::exchange(other.cert_, nullptr)) {}

    Certificate& Certificate::operator=(Certificate&& other) noexcept {
        if (this != &other) {
            if (cert_ != nullptr) {
                X509_free(cert_);
            }
            cert_ = std::exchange(other.cert_, nullptr);
        }
        return *this;
    }

    Certificate Certificate::borrow(X509* cert) {
        if (cert == nullptr) {
            throw CertificateError("Null certificate");
        }
        X509_up_ref(cert);
        return Certificate(cert);
    }

    Certificate Certificate::parse(std::string_view bytes) {
        if (bytes.empty()) {
            throw CertificateError("Failed to parse X.509 certificate: empty input");
        }
        if (bytes.size() > static_cast<size_t>(INT_MAX)) {
            throw CertificateError("Failed to parse X.509 certificate: input too large");
        }

        ERR_clear_error();

        BioPtr pem = make_mem_bio(bytes);
        if (X509* cert = PEM_read_bio_X509(pem.get(), nullptr, nullptr, nullptr); cert != nullptr) {
            return Certificate(cert);
        }

        ERR_clear_error();

        BioPtr der = make_mem_bio(bytes);
        if (X509* cert = d2i_X509_bio(der.get(), nullptr); cert != nullptr) {
            return Certificate(cert);
        }

        throw CertificateError("Failed to parse X.509 certificate: " + openssl_error_string());
    }

    std::string Certificate::subject() const { return name_to_string(X509_get_subject_name(cert_)); }

    std::string Certificate::issuer() const { return name_to_string(X509_get_issuer_name(cert_)); }

    std::string openssl_error_string() {
        std::string out;
        std::array<char, OPENSSL_ERROR_BUFFER_SIZE> buf{};
        for (unsigned long code = ERR_get_error(); code != 0; code = ERR_get_error()) {
            ERR_error_string_n(code, buf.data(), buf.size());
            if (!out.empty()) {
                out += "; ";
            }
            out += buf.data();
        }
        return out.empty() ? std::string("unknown OpenSSL error") : out;
    }
}  // namespace http::security
