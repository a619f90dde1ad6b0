#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../src/http/security/certificate.hpp"
#include "../src/http/security/trust_aggregator.hpp"
#include "../src/http/security/trust_store.hpp"
#include "../src/http/security/x509_store_delegate.hpp"
#include "support/test_certificates.hpp"

using http::security::Certificate;
using http::security::CertificateChain;
using http::security::CertificateError;
using http::security::TrustAggregator;
using http::security::TrustDelegate;
using http::security::TrustFailure;
using http::security::TrustRole;
using http::security::TrustStore;
using http::security::X509StoreDelegate;

namespace {
    struct Calls {
        int count_ = 0;
        std::vector<TrustRole> roles_;
        std::vector<std::string> auth_types_;
    };

    class FakeDelegate : public TrustDelegate {
       public:
        FakeDelegate(bool verdict, Calls* calls, std::vector<Certificate> issuers = {})
            : verdict_(verdict), calls_(calls), issuers_(std::move(issuers)) {}

        bool trusts(const CertificateChain& /*chain*/, const std::string& auth_type, TrustRole role) const override {
            ++calls_->count_;
            calls_->roles_.push_back(role);
            calls_->auth_types_.push_back(auth_type);
            return verdict_;
        }

        std::vector<Certificate> accepted_issuers() const override { return issuers_; }

       private:
        bool verdict_;
        Calls* calls_;
        std::vector<Certificate> issuers_;
    };

    std::unique_ptr<TrustAggregator> aggregator_of(std::vector<std::unique_ptr<TrustDelegate>> delegates) {
        return std::make_unique<TrustAggregator>(std::move(delegates));
    }

    class TrustAggregatorTest : public ::testing::Test {
       protected:
        test_support::Identity ca_ = test_support::make_self_signed("courier-test-ca");
        test_support::Identity leaf_ = test_support::make_signed_by("courier-test-leaf", ca_);
        CertificateChain chain_{leaf_.cert_};
    };
}  // namespace

TEST_F(TrustAggregatorTest, FirstAcceptingDelegateShortCircuits) {
    Calls first;
    Calls second;
    std::vector<std::unique_ptr<TrustDelegate>> delegates;
    delegates.push_back(std::make_unique<FakeDelegate>(true, &first));
    delegates.push_back(std::make_unique<FakeDelegate>(true, &second));
    auto aggregator = aggregator_of(std::move(delegates));

    EXPECT_NO_THROW(aggregator->check_server_trusted(chain_, "ECDHE_RSA"));
    EXPECT_EQ(first.count_, 1);
    EXPECT_EQ(second.count_, 0);
}

TEST_F(TrustAggregatorTest, LaterDelegateMayAccept) {
    Calls first;
    Calls second;
    std::vector<std::unique_ptr<TrustDelegate>> delegates;
    delegates.push_back(std::make_unique<FakeDelegate>(false, &first));
    delegates.push_back(std::make_unique<FakeDelegate>(true, &second));
    auto aggregator = aggregator_of(std::move(delegates));

    EXPECT_NO_THROW(aggregator->check_server_trusted(chain_, "ECDHE_ECDSA"));
    EXPECT_EQ(first.count_, 1);
    EXPECT_EQ(second.count_, 1);
    EXPECT_EQ(second.auth_types_.front(), "ECDHE_ECDSA");
}

TEST_F(TrustAggregatorTest, RejectsWhenNoDelegateAccepts) {
    Calls first;
    Calls second;
    std::vector<std::unique_ptr<TrustDelegate>> delegates;
    delegates.push_back(std::make_unique<FakeDelegate>(false, &first));
    delegates.push_back(std::make_unique<FakeDelegate>(false, &second));
    auto aggregator = aggregator_of(std::move(delegates));

    EXPECT_THROW(aggregator->check_server_trusted(chain_, "RSA"), TrustFailure);
    EXPECT_EQ(first.count_, 1);
    EXPECT_EQ(second.count_, 1);
}

TEST_F(TrustAggregatorTest, NoDelegatesMeansNoTrust) {
    auto aggregator = aggregator_of({});
    EXPECT_THROW(aggregator->check_client_trusted(chain_, "RSA"), TrustFailure);
}

TEST_F(TrustAggregatorTest, RoleIsForwarded) {
    Calls calls;
    std::vector<std::unique_ptr<TrustDelegate>> delegates;
    delegates.push_back(std::make_unique<FakeDelegate>(true, &calls));
    auto aggregator = aggregator_of(std::move(delegates));

    aggregator->check_client_trusted(chain_, "RSA");
    aggregator->check_server_trusted(chain_, "RSA");

    EXPECT_EQ(calls.roles_, (std::vector<TrustRole>{TrustRole::CLIENT, TrustRole::SERVER}));
}

TEST_F(TrustAggregatorTest, AcceptedIssuersConcatenateInDelegateOrder) {
    Calls unused;
    std::vector<std::unique_ptr<TrustDelegate>> delegates;
    delegates.push_back(std::make_unique<FakeDelegate>(false, &unused, std::vector<Certificate>{ca_.cert_}));
    delegates.push_back(std::make_unique<FakeDelegate>(false, &unused, std::vector<Certificate>{ca_.cert_, leaf_.cert_}));
    auto aggregator = aggregator_of(std::move(delegates));

    const auto issuers = aggregator->accepted_issuers();
    ASSERT_EQ(issuers.size(), 3U);
    EXPECT_EQ(issuers[0].native(), ca_.cert_.native());
    EXPECT_EQ(issuers[1].native(), ca_.cert_.native());
    EXPECT_EQ(issuers[2].native(), leaf_.cert_.native());
}

TEST_F(TrustAggregatorTest, CustomStoreTrustsChainSystemRootsDoNot) {
    std::vector<TrustStore> stores;
    stores.push_back(http::security::load_trust_store(ca_.cert_pem()));
    TrustAggregator aggregator(std::move(stores));

    EXPECT_EQ(aggregator.delegate_count(), 2U);
    EXPECT_NO_THROW(aggregator.check_server_trusted(chain_, "ECDHE_ECDSA"));

    TrustAggregator system_only(std::vector<TrustStore>{});
    EXPECT_EQ(system_only.delegate_count(), 1U);
    EXPECT_THROW(system_only.check_server_trusted(chain_, "ECDHE_ECDSA"), TrustFailure);
}

TEST_F(TrustAggregatorTest, UnrelatedAnchorIsRejected) {
    const auto other = test_support::make_self_signed("courier-other-ca");
    std::vector<TrustStore> stores;
    stores.push_back(http::security::load_trust_store(other.cert_pem()));
    TrustAggregator aggregator(std::move(stores));

    EXPECT_THROW(aggregator.check_server_trusted(chain_, "ECDHE_ECDSA"), TrustFailure);
}

TEST_F(TrustAggregatorTest, PinnedLeafIsItsOwnAnchor) {
    TrustStore store;
    store.add(leaf_.cert_);
    const X509StoreDelegate pinned(std::move(store), true);

    EXPECT_TRUE(pinned.trusts(chain_, "ECDHE_ECDSA", TrustRole::SERVER));
}

TEST_F(TrustAggregatorTest, CustomIssuersFollowSystemIssuers) {
    std::vector<TrustStore> stores;
    stores.push_back(http::security::load_trust_store(ca_.cert_der()));
    TrustAggregator aggregator(std::move(stores));

    const auto issuers = aggregator.accepted_issuers();
    ASSERT_FALSE(issuers.empty());
    EXPECT_EQ(issuers.back().subject(), ca_.cert_.subject());
}

TEST(CertificateTest, ParsesPemAndDer) {
    const auto identity = test_support::make_self_signed("courier-parse");

    const Certificate from_pem = Certificate::parse(identity.cert_pem());
    const Certificate from_der = Certificate::parse(identity.cert_der());

    EXPECT_EQ(from_pem.subject(), "CN=courier-parse");
    EXPECT_EQ(from_der.subject(), "CN=courier-parse");
    EXPECT_EQ(from_pem.issuer(), from_pem.subject());
}

TEST(CertificateTest, GarbageIsRejected) {
    EXPECT_THROW(Certificate::parse("definitely not a certificate"), CertificateError);
    EXPECT_THROW(Certificate::parse(""), CertificateError);
    EXPECT_THROW(http::security::load_trust_store("-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n"), CertificateError);
}

TEST(CertificateTest, CopiesShareTheHandle) {
    const auto identity = test_support::make_self_signed("courier-copy");

    Certificate copy = identity.cert_;
    EXPECT_EQ(copy.native(), identity.cert_.native());

    Certificate moved = std::move(copy);
    EXPECT_EQ(moved.native(), identity.cert_.native());
    EXPECT_EQ(copy.native(), nullptr);  // NOLINT(bugprone-use-after-move)
}

TEST(TrustStoreTest, ListsAddedCertificates) {
    const auto a = test_support::make_self_signed("courier-a");
    const auto b = test_support::make_self_signed("courier-b");

    TrustStore store;
    store.add(a.cert_);
    store.add(b.cert_);

    EXPECT_EQ(store.certificates().size(), 2U);
}
