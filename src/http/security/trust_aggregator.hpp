#ifndef COURIER_TRUST_AGGREGATOR_HPP
#define COURIER_TRUST_AGGREGATOR_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "trust_delegate.hpp"
#include "trust_store.hpp"

namespace http::security {
    struct TrustFailure : public std::runtime_error {
        TrustFailure();
    };

    /**
     * Combines the platform's default trust with caller-supplied trust stores.
     *
     * A chain is accepted as soon as one delegate, tried in construction order, trusts it.
     * Rejections by individual delegates are not reported. Immutable once built, so one
     * instance can serve concurrent handshakes.
     */
    class TrustAggregator {
       public:
        // The system default delegate first, then one delegate per store.
        explicit TrustAggregator(std::vector<TrustStore> stores);

        explicit TrustAggregator(std::vector<std::unique_ptr<TrustDelegate>> delegates);

        ~TrustAggregator() = default;
        TrustAggregator(const TrustAggregator&) = delete;
        TrustAggregator& operator=(const TrustAggregator&) = delete;
        TrustAggregator(TrustAggregator&&) = delete;
        TrustAggregator& operator=(TrustAggregator&&) = delete;

        // Returns normally when some delegate trusts the chain, throws TrustFailure otherwise.
        void validate(const CertificateChain& chain, const std::string& auth_type, TrustRole role) const;
        void check_client_trusted(const CertificateChain& chain, const std::string& auth_type) const;
        void check_server_trusted(const CertificateChain& chain, const std::string& auth_type) const;

        // Concatenation over all delegates, in delegate order; duplicates are kept.
        [[nodiscard]] std::vector<Certificate> accepted_issuers() const;

        [[nodiscard]] size_t delegate_count() const { return delegates_.size(); }

       private:
        std::vector<std::unique_ptr<TrustDelegate>> delegates_;
    };
}  // namespace http::security

#endif
