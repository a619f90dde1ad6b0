#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"
#include "../security/ssl_socket_factory.hpp"

using namespace std::chrono;

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 0L;
        static constexpr const char* USER_AGENT = "courier/1.0";
        static constexpr const char* PROTOCOLS = "http,https";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long VERIFY_PEER = 1L;
        static constexpr long VERIFY_HOST = 2L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long NO_BODY = 1L;
        static constexpr long POST = 1L;
        static constexpr long LOW_SPEED_LIMIT_BYTES = 1L;
        static constexpr long MAX_LOW_SPEED_TIME_S = std::numeric_limits<long>::max() / constants::MILLISECONDS_PER_SECOND;
    };

    struct HeaderKeys {
        static constexpr const char* STATUS_LINE_PREFIX = "HTTP/";
    };

    CurlError::CurlError(CURLcode code, const std::string& msg) : std::runtime_error(msg), code_(code) {}

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw CurlError(CURLE_FAILED_INIT, "Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            curl_slist* appended = curl_slist_append(headers_, h.c_str());
            if (appended == nullptr) {
                throw CurlError(CURLE_OUT_OF_MEMORY, "curl_slist_append failed");
            }
            headers_ = appended;
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_PROTOCOLS_STR, CurlDefaults::PROTOCOLS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_SSL_VERIFYPEER, CurlDefaults::VERIFY_PEER);
        setopt(CURLOPT_SSL_VERIFYHOST, CurlDefaults::VERIFY_HOST);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body_));
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));
    }

    void CurlEasy::set_method(http::model::RequestMethod method) {
        using http::model::RequestMethod;
        switch (method) {
            case RequestMethod::GET:
                setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
                break;
            case RequestMethod::HEAD:
                setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
                break;
            case RequestMethod::POST:
                setopt(CURLOPT_POST, CurlDefaults::POST);
                break;
            case RequestMethod::OPTIONS:
            case RequestMethod::PUT:
            case RequestMethod::PATCH:
            case RequestMethod::DELETE:
                setopt(CURLOPT_CUSTOMREQUEST, http::model::to_string(method));
                break;
        }
    }

    void CurlEasy::set_body(const std::string& body) {
        // Size first so COPYPOSTFIELDS copies exactly these bytes, embedded NULs included.
        setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        setopt(CURLOPT_COPYPOSTFIELDS, body.c_str());
    }

    void CurlEasy::set_timeouts(milliseconds read_timeout, milliseconds connect_timeout) {
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));

        // libcurl has no socket read timeout; abort when under 1 B/s for the whole window instead.
        if (read_timeout.count() > 0) {
            const auto ms = read_timeout.count();
            // Rounded up without overflow, then capped since libcurl scales the window back to ms.
            const long window_s = std::min<long>(static_cast<long>(ms / constants::MILLISECONDS_PER_SECOND + (ms % constants::MILLISECONDS_PER_SECOND != 0 ? 1 : 0)),
                                                 CurlDefaults::MAX_LOW_SPEED_TIME_S);
            setopt(CURLOPT_LOW_SPEED_LIMIT, CurlDefaults::LOW_SPEED_LIMIT_BYTES);
            setopt(CURLOPT_LOW_SPEED_TIME, window_s);
        }
    }

    void CurlEasy::set_ssl_socket_factory(const http::security::SslSocketFactory* factory) {
        // The factory is the only source of trust; keep libcurl from loading its own CA bundle.
        setopt(CURLOPT_CAINFO, static_cast<const char*>(nullptr));
        setopt(CURLOPT_CAPATH, static_cast<const char*>(nullptr));
        setopt(CURLOPT_SSL_CTX_FUNCTION, &http::security::SslSocketFactory::install);
        setopt(CURLOPT_SSL_CTX_DATA, const_cast<void*>(static_cast<const void*>(factory)));
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A status line starts a new header block (interim 1xx, proxy CONNECT); only the last one counts.
        if (string_utils::ieq_prefix(buffer, bytes, HeaderKeys::STATUS_LINE_PREFIX)) {
            self->headers_seen_.clear();
            self->last_header_name_.clear();
            return bytes;
        }

        std::string line(buffer, bytes);
        if (string_utils::trim(line).empty()) {
            return bytes;
        }

        // obs-fold continuation of the previous field
        if ((line.front() == ' ' || line.front() == '\t') && !self->last_header_name_.empty()) {
            auto it = self->headers_seen_.find(self->last_header_name_);
            if (it != self->headers_seen_.end()) {
                it->second += " " + string_utils::trim(line);
            }
            return bytes;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return bytes;
        }

        std::string name = string_utils::trim(line.substr(0, colon));
        std::string value = string_utils::trim(line.substr(colon + 1));
        if (name.empty()) {
            return bytes;
        }

        auto [it, inserted] = self->headers_seen_.try_emplace(name, value);
        if (!inserted) {
            it->second += "," + value;
        }
        self->last_header_name_ = std::move(name);

        return bytes;
    }

    RawResponse CurlEasy::perform() {
        body_.clear();
        headers_seen_.clear();
        last_header_name_.clear();

        perform_throw();

        long code = 0;
        const auto rc = curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        if (rc != CURLE_OK) {
            throw CurlError(rc, std::string("curl_easy_getinfo failed: ") + curl_easy_strerror(rc));
        }

        RawResponse r;
        r.status_ = code;
        r.body_ = std::move(body_);
        r.headers_ = std::move(headers_seen_);
        return r;
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw CurlError(rc, std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw() {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw CurlError(rc, err);
    }

}  // namespace http::client
