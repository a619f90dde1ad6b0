#include "test_certificates.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include <atomic>
#include <cstring>
#include <stdexcept>
#include <string>

namespace test_support {
    namespace {
        constexpr long ONE_HOUR_S = 60L * 60L;
        constexpr long ONE_DAY_S = 24L * ONE_HOUR_S;

        std::atomic<long> next_serial{1};

        EvpPkeyPtr generate_key() {
            EvpPkeyPtr key(EVP_EC_gen("P-256"));
            if (!key) {
                throw std::runtime_error("EC key generation failed");
            }
            return key;
        }

        void add_extension(X509* cert, X509V3_CTX* ctx, int nid, const std::string& value) {
            X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, value.c_str());
            if (ext == nullptr) {
                throw std::runtime_error("Failed to build extension " + value);
            }
            const int rc = X509_add_ext(cert, ext, -1);
            X509_EXTENSION_free(ext);
            if (rc != 1) {
                throw std::runtime_error("Failed to add extension " + value);
            }
        }

        Identity build(const std::string& common_name, const Identity* issuer, const std::optional<std::string>& ip_san) {
            EvpPkeyPtr key = generate_key();

            http::security::Certificate cert(X509_new());
            X509* x = cert.native();
            X509_set_version(x, 2);
            ASN1_INTEGER_set(X509_get_serialNumber(x), next_serial.fetch_add(1));
            X509_gmtime_adj(X509_getm_notBefore(x), -ONE_HOUR_S);
            X509_gmtime_adj(X509_getm_notAfter(x), ONE_DAY_S);
            X509_set_pubkey(x, key.get());

            X509_NAME* name = X509_get_subject_name(x);
            X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
            X509_set_issuer_name(x, issuer != nullptr ? X509_get_subject_name(issuer->cert_.native()) : name);

            X509V3_CTX ctx;
            X509V3_set_ctx_nodb(&ctx);
            X509V3_set_ctx(&ctx, issuer != nullptr ? issuer->cert_.native() : x, x, nullptr, nullptr, 0);

            // Self-signed certificates act as roots; issued ones are end-entity.
            add_extension(x, &ctx, NID_basic_constraints, issuer == nullptr ? "critical,CA:TRUE" : "CA:FALSE");
            if (ip_san) {
                add_extension(x, &ctx, NID_subject_alt_name, "IP:" + *ip_san);
            }

            EVP_PKEY* signing_key = issuer != nullptr ? issuer->key_.get() : key.get();
            if (X509_sign(x, signing_key, EVP_sha256()) == 0) {
                throw std::runtime_error("Failed to sign test certificate");
            }

            return Identity{std::move(cert), std::move(key)};
        }
    }  // namespace

    std::string Identity::cert_pem() const {
        BIO* bio = BIO_new(BIO_s_mem());
        PEM_write_bio_X509(bio, cert_.native());
        char* data = nullptr;
        const long len = BIO_get_mem_data(bio, &data);
        std::string out(data, static_cast<size_t>(len));
        BIO_free(bio);
        return out;
    }

    std::string Identity::cert_der() const {
        unsigned char* der = nullptr;
        const int len = i2d_X509(cert_.native(), &der);
        if (len <= 0) {
            throw std::runtime_error("DER encoding failed");
        }
        std::string out(reinterpret_cast<const char*>(der), static_cast<size_t>(len));
        OPENSSL_free(der);
        return out;
    }

    Identity make_self_signed(const std::string& common_name, const std::optional<std::string>& ip_san) { return build(common_name, nullptr, ip_san); }

    Identity make_signed_by(const std::string& common_name, const Identity& issuer, const std::optional<std::string>& ip_san) {
        return build(common_name, &issuer, ip_san);
    }
}  // namespace test_support
