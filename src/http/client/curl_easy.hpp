#ifndef COURIER_CURL_EASY_HPP
#define COURIER_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "../model/model.hpp"

struct curl_slist;

namespace http::security {
    class SslSocketFactory;
}

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    struct CurlError : public std::runtime_error {
        CURLcode code_;
        explicit CurlError(CURLcode code, const std::string& msg);
    };

    struct RawResponse {
        long status_ = 0;
        std::string body_;
        http::model::HeaderMap headers_;
    };

    /**
     * One libcurl easy handle, used for exactly one exchange and released on destruction.
     * Redirects are never followed here; the caller decides what to do with a 3xx.
     */
    class CurlEasy {
       public:
        CurlEasy();

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void set_method(http::model::RequestMethod method);
        void set_body(const std::string& body);
        // Zero read timeout disables it; zero connect timeout keeps the libcurl default.
        void set_timeouts(std::chrono::milliseconds read_timeout, std::chrono::milliseconds connect_timeout);
        void set_ssl_socket_factory(const http::security::SslSocketFactory* factory);

        // Blocks until the response is complete. Throws CurlError on any transport failure.
        RawResponse perform();

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw();
        void set_defaults_once();
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::string body_;
        http::model::HeaderMap headers_seen_;
        std::string last_header_name_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
