#include "curl_global.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

namespace http::client {
    namespace {
        const std::array<const char*, 4> OPENSSL_FAMILY = {"OpenSSL", "LibreSSL", "BoringSSL", "quictls"};
    }

    bool supports_ssl_ctx_hook(const char* ssl_version) {
        if (ssl_version == nullptr) {
            return false;
        }
        for (const char* name : OPENSSL_FAMILY) {
            if (std::strncmp(ssl_version, name, std::strlen(name)) == 0) {
                return true;
            }
        }
        return false;
    }

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

    std::shared_ptr<CurlGlobal> CurlGlobal::acquire() {
        static std::mutex mutex;
        static std::weak_ptr<CurlGlobal> current;

        std::lock_guard<std::mutex> lock(mutex);
        std::shared_ptr<CurlGlobal> global = current.lock();
        if (!global) {
            global = std::make_shared<CurlGlobal>();
            current = global;
        }
        return global;
    }

    void CurlGlobal::require_openssl_backend() const {
        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        const char* backend = info != nullptr ? info->ssl_version : nullptr;
        if (!supports_ssl_ctx_hook(backend)) {
            throw std::runtime_error(std::string("libcurl TLS backend must be OpenSSL, found: ") + (backend != nullptr ? backend : "none"));
        }
    }

}  // namespace http::client
