#include <gtest/gtest.h>

#include "keyring/core/CompositeProvider.hpp"
#include "keyring/core/ProviderConfig.hpp"
#include "keyring/providers/DefaultProvider.hpp"

#include <memory>

TEST(DefaultProviderTest, ForcedBackendsSkipTheAvailabilityCheck)
{
    keyring::core::ProviderConfig config{};

    config.backend = keyring::core::BackendPreference::SecretService;
    const auto secretService{ keyring::providers::makeDefaultProvider(config) };
    ASSERT_NE(secretService, nullptr);
    EXPECT_EQ(dynamic_cast<keyring::core::CompositeProvider*>(secretService.get()), nullptr);

    config.backend = keyring::core::BackendPreference::Keyctl;
    const auto keyctl{ keyring::providers::makeDefaultProvider(config) };
    ASSERT_NE(keyctl, nullptr);
    EXPECT_EQ(dynamic_cast<keyring::core::CompositeProvider*>(keyctl.get()), nullptr);
}

TEST(DefaultProviderTest, PlatformBackendIsTheKernelKeyring)
{
    const auto platform{ keyring::providers::makePlatformBackend(keyring::core::ProviderConfig{}) };
    EXPECT_NE(platform, nullptr);
}

TEST(DefaultProviderTest, AutoAlwaysYieldsAProvider)
{
    const auto provider{ keyring::providers::makeDefaultProvider(keyring::core::ProviderConfig{}) };
    EXPECT_NE(provider, nullptr);
}

TEST(DefaultProviderTest, DefaultProviderIsBuiltOnce)
{
    auto& first{ keyring::providers::defaultProvider() };
    auto& second{ keyring::providers::defaultProvider() };
    EXPECT_EQ(&first, &second);
}
