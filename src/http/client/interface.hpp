#ifndef COURIER_CLIENT_INTERFACE_HPP
#define COURIER_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"
#include "result.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual Result execute(http::model::Request& request) = 0;
    };
}  // namespace http::client

#endif
