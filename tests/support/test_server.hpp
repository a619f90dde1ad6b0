#ifndef COURIER_TEST_SERVER_HPP
#define COURIER_TEST_SERVER_HPP

#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "test_certificates.hpp"

namespace test_support {
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct RecordedRequest {
        std::string method_;
        std::string target_;
        HeaderList headers_;
        std::string body_;

        [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> header_values(const std::string& name) const;
    };

    struct ScriptedResponse {
        int status_ = 200;
        HeaderList headers_;
        std::string body_;
        std::chrono::milliseconds delay_{0};
    };

    /**
     * Loopback HTTP/1.1 server on 127.0.0.1 with an ephemeral port, serving scripted responses
     * by request target from a background thread. One request per connection. With an identity
     * it speaks TLS instead.
     */
    class TestServer {
       public:
        TestServer();
        explicit TestServer(const Identity& tls_identity);

        ~TestServer();
        TestServer(const TestServer&) = delete;
        TestServer& operator=(const TestServer&) = delete;
        TestServer(TestServer&&) = delete;
        TestServer& operator=(TestServer&&) = delete;

        void route(const std::string& target, ScriptedResponse response);

        [[nodiscard]] std::string url(const std::string& target) const;
        [[nodiscard]] std::vector<RecordedRequest> requests() const;
        [[nodiscard]] uint16_t port() const { return port_; }
        [[nodiscard]] int failed_handshakes() const { return failed_handshakes_.load(); }

        // Port that was bound once and released, so nothing listens on it.
        static uint16_t unused_port();

       private:
        void start();
        void serve();
        void handle(int fd);

        int listen_fd_ = -1;
        uint16_t port_ = 0;
        SSL_CTX* ssl_ctx_ = nullptr;

        std::atomic<bool> stop_{false};
        std::atomic<int> failed_handshakes_{0};
        std::thread thread_;

        mutable std::mutex mutex_;
        std::map<std::string, ScriptedResponse> routes_;
        std::vector<RecordedRequest> requests_;
    };
}  // namespace test_support

#endif
