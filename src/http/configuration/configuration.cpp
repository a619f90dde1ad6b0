#include "configuration.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::configuration {

    //
    // HttpClientConfiguration implementation
    //

    HttpClientConfiguration::HttpClientConfiguration(std::chrono::milliseconds read_timeout, std::chrono::milliseconds connect_timeout,
                                                     std::optional<std::string> certificate, bool follow_redirects, int max_redirects)
        : read_timeout_(read_timeout),
          connect_timeout_(connect_timeout),
          certificate_(std::move(certificate)),
          follow_redirects_(follow_redirects),
          max_redirects_(max_redirects) {}

    HttpClientConfigurationBuilder HttpClientConfiguration::builder() { return {}; }

    //
    // HttpClientConfigurationBuilder implementation
    //

    HttpClientConfigurationBuilder::HttpClientConfigurationBuilder()
        : read_timeout_(constants::DEFAULT_READ_TIMEOUT_MS),
          connect_timeout_(constants::DEFAULT_CONNECT_TIMEOUT_MS),
          max_redirects_(constants::DEFAULT_MAX_REDIRECTS) {}

    HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::with_read_timeout(std::chrono::milliseconds read_timeout) {
        read_timeout_ = read_timeout;
        return *this;
    }

    HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::with_connect_timeout(std::chrono::milliseconds connect_timeout) {
        connect_timeout_ = connect_timeout;
        return *this;
    }

    HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::with_certificate(std::string certificate_bytes) {
        certificate_ = std::move(certificate_bytes);
        return *this;
    }

    HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::with_certificate_stream(std::istream& in) {
        certificate_ = string_utils::read_text_and_close(in);
        return *this;
    }

    HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::with_certificate_file(const std::string& path) {
        certificate_ = string_utils::read_file_text(path);
        return *this;
    }

    HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::with_follow_redirects(bool follow_redirects) {
        follow_redirects_ = follow_redirects;
        return *this;
    }

    HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::with_max_redirects(int max_redirects) {
        max_redirects_ = max_redirects;
        return *this;
    }

    const HttpClientConfigurationBuilder& HttpClientConfigurationBuilder::validate() const {
        if (read_timeout_.count() < 0) {
            throw std::invalid_argument("Read timeout must be non-negative");
        }
        if (connect_timeout_.count() < 0) {
            throw std::invalid_argument("Connect timeout must be non-negative");
        }
        if (max_redirects_ < 0) {
            throw std::invalid_argument("Max redirects must be non-negative");
        }
        if (certificate_ && certificate_->empty()) {
            throw std::invalid_argument("Certificate must not be empty");
        }
        return *this;
    }

    HttpClientConfiguration HttpClientConfigurationBuilder::build() const {
        validate();
        return {read_timeout_, connect_timeout_, certificate_, follow_redirects_, max_redirects_};
    }
}  // namespace http::configuration
