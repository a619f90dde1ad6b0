#ifndef COURIER_X509_STORE_DELEGATE_HPP
#define COURIER_X509_STORE_DELEGATE_HPP

#include <string>
#include <vector>

#include "trust_delegate.hpp"
#include "trust_store.hpp"

namespace http::security {
    /**
     * Runs OpenSSL chain verification against one trust store.
     *
     * allow_partial_chain lets any certificate in the store act as an anchor, including a
     * pinned leaf or intermediate that is not self-signed.
     */
    class X509StoreDelegate : public TrustDelegate {
       public:
        explicit X509StoreDelegate(TrustStore store, bool allow_partial_chain);

        [[nodiscard]] bool trusts(const CertificateChain& chain, const std::string& auth_type, TrustRole role) const override;
        [[nodiscard]] std::vector<Certificate> accepted_issuers() const override;

       private:
        TrustStore store_;
        bool allow_partial_chain_;
    };
}  // namespace http::security

#endif
