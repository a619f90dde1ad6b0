#ifndef COURIER_INTERCEPTOR_HPP
#define COURIER_INTERCEPTOR_HPP

#include <functional>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "../model/model.hpp"

namespace http::interceptor {
    class RequestInterceptor {
       public:
        RequestInterceptor() = default;
        virtual ~RequestInterceptor() = default;
        RequestInterceptor(const RequestInterceptor&) = delete;
        RequestInterceptor& operator=(const RequestInterceptor&) = delete;
        RequestInterceptor(RequestInterceptor&&) = delete;
        RequestInterceptor& operator=(RequestInterceptor&&) = delete;

        // Mutates the live request before dispatch. Exceptions propagate out of execute().
        virtual void intercept(http::model::Request& request) = 0;
    };

    class FunctionInterceptor : public RequestInterceptor {
       public:
        explicit FunctionInterceptor(std::function<void(http::model::Request&)> fn);

        void intercept(http::model::Request& request) override;

       private:
        std::function<void(http::model::Request&)> fn_;
    };

    std::shared_ptr<RequestInterceptor> make_interceptor(std::function<void(http::model::Request&)> fn);

    /**
     * Ordered list of interceptors. apply() runs a snapshot taken under a shared lock, so the
     * list can be edited while requests are in flight, including from inside an interceptor.
     */
    class InterceptorChain {
       public:
        void add(std::shared_ptr<RequestInterceptor> interceptor);
        // Removes the first registration of this exact instance; returns false if absent.
        bool remove(const std::shared_ptr<RequestInterceptor>& interceptor);
        void clear();
        [[nodiscard]] size_t size() const;

        void apply(http::model::Request& request) const;

       private:
        mutable std::shared_mutex mutex_;
        std::vector<std::shared_ptr<RequestInterceptor>> interceptors_;
    };
}  // namespace http::interceptor

#endif
