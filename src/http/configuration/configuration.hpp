#ifndef COURIER_CONFIGURATION_HPP
#define COURIER_CONFIGURATION_HPP

#include <chrono>
#include <istream>
#include <optional>
#include <string>

namespace http::configuration {
    class HttpClientConfigurationBuilder;

    class HttpClientConfiguration {
       public:
        [[nodiscard]] std::chrono::milliseconds read_timeout() const { return read_timeout_; }
        [[nodiscard]] std::chrono::milliseconds connect_timeout() const { return connect_timeout_; }
        [[nodiscard]] const std::optional<std::string>& certificate() const { return certificate_; }
        [[nodiscard]] bool follow_redirects() const { return follow_redirects_; }
        [[nodiscard]] int max_redirects() const { return max_redirects_; }

        static HttpClientConfigurationBuilder builder();

       private:
        friend class HttpClientConfigurationBuilder;

        HttpClientConfiguration(std::chrono::milliseconds read_timeout, std::chrono::milliseconds connect_timeout,
                                std::optional<std::string> certificate, bool follow_redirects, int max_redirects);

        std::chrono::milliseconds read_timeout_;
        std::chrono::milliseconds connect_timeout_;
        std::optional<std::string> certificate_;
        bool follow_redirects_;
        int max_redirects_;
    };

    class HttpClientConfigurationBuilder {
       public:
        HttpClientConfigurationBuilder();

        // Zero read timeout disables it; zero connect timeout keeps the libcurl default.
        HttpClientConfigurationBuilder& with_read_timeout(std::chrono::milliseconds read_timeout);
        HttpClientConfigurationBuilder& with_connect_timeout(std::chrono::milliseconds connect_timeout);

        // Raw PEM or DER bytes of one X.509 certificate to trust next to the system roots.
        HttpClientConfigurationBuilder& with_certificate(std::string certificate_bytes);
        HttpClientConfigurationBuilder& with_certificate_stream(std::istream& in);
        HttpClientConfigurationBuilder& with_certificate_file(const std::string& path);

        HttpClientConfigurationBuilder& with_follow_redirects(bool follow_redirects);
        HttpClientConfigurationBuilder& with_max_redirects(int max_redirects);

        // Throws std::invalid_argument for negative timeouts or limits and an empty certificate.
        const HttpClientConfigurationBuilder& validate() const;
        // Validates first.
        [[nodiscard]] HttpClientConfiguration build() const;

       private:
        std::chrono::milliseconds read_timeout_;
        std::chrono::milliseconds connect_timeout_;
        std::optional<std::string> certificate_;
        bool follow_redirects_ = true;
        int max_redirects_;
    };
}  // namespace http::configuration

#endif
