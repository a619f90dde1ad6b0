#include "interceptor.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

namespace http::interceptor {
    FunctionInterceptor::FunctionInterceptor(std::function<void(http::model::Request&)> fn) : fn_(std::move(fn)) {}

    void FunctionInterceptor::intercept(http::model::Request& request) { fn_(request); }

    std::shared_ptr<RequestInterceptor> make_interceptor(std::function<void(http::model::Request&)> fn) {
        return std::make_shared<FunctionInterceptor>(std::move(fn));
    }

    void InterceptorChain::add(std::shared_ptr<RequestInterceptor> interceptor) {
        if (interceptor == nullptr) {
            throw std::invalid_argument("Interceptor must not be null");
        }
        std::unique_lock lock(mutex_);
        interceptors_.push_back(std::move(interceptor));
    }

    bool InterceptorChain::remove(const std::shared_ptr<RequestInterceptor>& interceptor) {
        std::unique_lock lock(mutex_);
        auto it = std::find(interceptors_.begin(), interceptors_.end(), interceptor);
        if (it == interceptors_.end()) {
            return false;
        }
        interceptors_.erase(it);
        return true;
    }

    void InterceptorChain::clear() {
        std::unique_lock lock(mutex_);
        interceptors_.clear();
    }

    size_t InterceptorChain::size() const {
        std::shared_lock lock(mutex_);
        return interceptors_.size();
    }

    void InterceptorChain::apply(http::model::Request& request) const {
        std::vector<std::shared_ptr<RequestInterceptor>> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot = interceptors_;
        }

        for (const auto& interceptor : snapshot) {
            interceptor->intercept(request);
        }
    }
}  // namespace http::interceptor
