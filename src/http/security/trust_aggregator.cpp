#include "trust_aggregator.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

#include "x509_store_delegate.hpp"

namespace http::security {
    TrustFailure::TrustFailure() : std::runtime_error("None of the trust delegates trust this certificate chain") {}

    TrustAggregator::TrustAggregator(std::vector<TrustStore> stores) {
        delegates_.reserve(stores.size() + 1);
        delegates_.push_back(std::make_unique<X509StoreDelegate>(TrustStore::system_default(), false));
        for (auto& store : stores) {
            delegates_.push_back(std::make_unique<X509StoreDelegate>(std::move(store), true));
        }
    }

    TrustAggregator::TrustAggregator(std::vector<std::unique_ptr<TrustDelegate>> delegates) : delegates_(std::move(delegates)) {}

    void TrustAggregator::validate(const CertificateChain& chain, const std::string& auth_type, TrustRole role) const {
        const bool trusted =
            std::any_of(delegates_.begin(), delegates_.end(), [&](const auto& delegate) { return delegate->trusts(chain, auth_type, role); });
        if (!trusted) {
            throw TrustFailure();
        }
    }

    void TrustAggregator::check_client_trusted(const CertificateChain& chain, const std::string& auth_type) const {
        validate(chain, auth_type, TrustRole::CLIENT);
    }

    void TrustAggregator::check_server_trusted(const CertificateChain& chain, const std::string& auth_type) const {
        validate(chain, auth_type, TrustRole::SERVER);
    }

    std::vector<Certificate> TrustAggregator::accepted_issuers() const {
        std::vector<Certificate> certificates;
        for (const auto& delegate : delegates_) {
            std::vector<Certificate> issuers = delegate->accepted_issuers();
            certificates.insert(certificates.end(), std::make_move_iterator(issuers.begin()), std::make_move_iterator(issuers.end()));
        }
        return certificates;
    }
}  // namespace http::security
