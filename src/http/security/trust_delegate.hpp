#ifndef COURIER_TRUST_DELEGATE_HPP
#define COURIER_TRUST_DELEGATE_HPP

#include <string>
#include <vector>

#include "certificate.hpp"

namespace http::security {
    enum class TrustRole {
        CLIENT,
        SERVER,
    };

    class TrustDelegate {
       public:
        TrustDelegate() = default;
        virtual ~TrustDelegate() = default;
        TrustDelegate(const TrustDelegate&) = delete;
        TrustDelegate& operator=(const TrustDelegate&) = delete;
        TrustDelegate(TrustDelegate&&) = delete;
        TrustDelegate& operator=(TrustDelegate&&) = delete;

        // True when this delegate trusts the chain presented by a peer acting in `role`.
        [[nodiscard]] virtual bool trusts(const CertificateChain& chain, const std::string& auth_type, TrustRole role) const = 0;
        [[nodiscard]] virtual std::vector<Certificate> accepted_issuers() const = 0;
    };
}  // namespace http::security

#endif
