#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "keyring/core/CompositeProvider.hpp"
#include "keyring/core/KeyringErrors.hpp"
#include "test_utils/FakeKeyringProvider.hpp"
#include "test_utils/MockKeyringProvider.hpp"
#include "test_utils/ProviderContractScenarios.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

namespace
{

class CompositeProviderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto primary{ std::make_unique<StrictMock<keyring::test_utils::MockKeyringProvider>>() };
        auto fallback{ std::make_unique<StrictMock<keyring::test_utils::MockKeyringProvider>>() };
        m_primary = primary.get();
        m_fallback = fallback.get();
        m_composite = std::make_unique<keyring::core::CompositeProvider>(std::move(primary), std::move(fallback));
    }

    StrictMock<keyring::test_utils::MockKeyringProvider>* m_primary{ nullptr };  // NOLINT
    StrictMock<keyring::test_utils::MockKeyringProvider>* m_fallback{ nullptr }; // NOLINT
    std::unique_ptr<keyring::core::CompositeProvider> m_composite;               // NOLINT
};

} // namespace

TEST_F(CompositeProviderTest, SucceedingPrimaryGetNeverConsultsFallback)
{
    EXPECT_CALL(*m_primary, getSecret("svc", "alice")).WillOnce(Return("from-primary"));
    EXPECT_CALL(*m_fallback, getSecret).Times(0);

    EXPECT_EQ(m_composite->getSecret("svc", "alice"), "from-primary");
}

TEST_F(CompositeProviderTest, SucceedingPrimarySetNeverConsultsFallback)
{
    EXPECT_CALL(*m_primary, setSecret("svc", "alice", "pw")).Times(1);
    EXPECT_CALL(*m_fallback, setSecret).Times(0);

    EXPECT_NO_THROW(m_composite->setSecret("svc", "alice", "pw"));
}

TEST_F(CompositeProviderTest, SucceedingPrimaryDeleteNeverConsultsFallback)
{
    EXPECT_CALL(*m_primary, deleteSecret("svc", "alice")).Times(1);
    EXPECT_CALL(*m_fallback, deleteSecret).Times(0);

    EXPECT_NO_THROW(m_composite->deleteSecret("svc", "alice"));
}

TEST_F(CompositeProviderTest, SucceedingPrimaryDeleteAllNeverConsultsFallback)
{
    EXPECT_CALL(*m_primary, deleteAll("svc")).Times(1);
    EXPECT_CALL(*m_fallback, deleteAll).Times(0);

    EXPECT_NO_THROW(m_composite->deleteAll("svc"));
}

TEST_F(CompositeProviderTest, FailingPrimaryReturnsFallbackResult)
{
    EXPECT_CALL(*m_primary, getSecret("svc", "alice"))
        .WillOnce(Throw(keyring::core::ServiceUnavailable("bus down")));
    EXPECT_CALL(*m_fallback, getSecret("svc", "alice")).WillOnce(Return("from-fallback"));

    EXPECT_EQ(m_composite->getSecret("svc", "alice"), "from-fallback");
}

TEST_F(CompositeProviderTest, FallbackErrorReplacesPrimaryError)
{
    EXPECT_CALL(*m_primary, setSecret("svc", "alice", "pw"))
        .WillOnce(Throw(keyring::core::ServiceUnavailable("bus down")));
    EXPECT_CALL(*m_fallback, setSecret("svc", "alice", "pw"))
        .WillOnce(Throw(keyring::core::StorageRejected("refused")));

    EXPECT_THROW(m_composite->setSecret("svc", "alice", "pw"), keyring::core::StorageRejected);
}

TEST_F(CompositeProviderTest, NotFoundFromPrimaryAlsoTriesFallback)
{
    EXPECT_CALL(*m_primary, deleteSecret("svc", "alice")).WillOnce(Throw(keyring::core::NotFound{}));
    EXPECT_CALL(*m_fallback, deleteSecret("svc", "alice")).Times(1);

    EXPECT_NO_THROW(m_composite->deleteSecret("svc", "alice"));
}

TEST_F(CompositeProviderTest, DeleteAllFollowsTheSamePolicy)
{
    EXPECT_CALL(*m_primary, deleteAll("svc")).WillOnce(Throw(keyring::core::UnlockFailed("dismissed")));
    EXPECT_CALL(*m_fallback, deleteAll("svc")).Times(1);

    EXPECT_NO_THROW(m_composite->deleteAll("svc"));
}

TEST(CompositeProviderWithoutFallbackTest, PrimaryErrorPropagatesUnchanged)
{
    auto primary{ std::make_unique<StrictMock<keyring::test_utils::MockKeyringProvider>>() };
    EXPECT_CALL(*primary, getSecret("svc", "alice")).WillOnce(Throw(keyring::core::UnlockFailed("dismissed")));

    keyring::core::CompositeProvider composite{ std::move(primary), nullptr };
    EXPECT_FALSE(composite.hasFallback());
    EXPECT_THROW((void)composite.getSecret("svc", "alice"), keyring::core::UnlockFailed);
}

TEST(CompositeProviderWithoutFallbackTest, RejectsMissingPrimary)
{
    EXPECT_THROW(keyring::core::CompositeProvider(nullptr, std::make_unique<keyring::test_utils::FakeKeyringProvider>()),
                 std::invalid_argument);
}

TEST(CompositeProviderContractTest, UnreachablePrimaryStillHonoursContract)
{
    auto primary{ std::make_unique<keyring::test_utils::FakeKeyringProvider>() };
    primary->failing(true);
    keyring::core::CompositeProvider composite{ std::move(primary),
                                                std::make_unique<keyring::test_utils::FakeKeyringProvider>() };

    keyring::test_utils::runRoundTripScenario(composite, "svc");
    keyring::test_utils::runMissingEntryScenario(composite, "svc");
    keyring::test_utils::runOverwriteScenario(composite, "svc");
    keyring::test_utils::runDeleteAllScenario(composite, "svc", "other-svc");
    keyring::test_utils::runEmptyServiceScenario(composite);
}
