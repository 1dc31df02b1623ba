#include "keyring/providers/DefaultProvider.hpp"

#include "keyring/core/Log.hpp"
#include "keyring/core/ProviderSelection.hpp"
#include "keyring/providers/secretservice/SecretServiceProviderFactory.hpp"
#include <memory>
#include <stdexcept>

namespace keyring::providers
{

std::unique_ptr<keyring::core::IKeyringProvider> makeDefaultProvider(const keyring::core::ProviderConfig& config)
{
    using keyring::core::BackendPreference;

    keyring::core::logger().debug("provider: backend={}, keyctl scope={}", keyring::core::toString(config.backend),
                                  keyring::core::toString(config.keyctlScope));

    switch (config.backend)
    {
    case BackendPreference::SecretService:
        return secretservice::makeSecretServiceProvider(config.collectionPath);
    case BackendPreference::Keyctl:
    {
        auto platform{ makePlatformBackend(config) };
        if (!platform)
        {
            throw std::invalid_argument("keyctl backend is not available in this build");
        }
        return platform;
    }
    case BackendPreference::Auto:
        break;
    }

    keyring::core::ProviderCandidates candidates{};
    candidates.makePrimary = [&config] { return secretservice::makeSecretServiceProvider(config.collectionPath); };
    candidates.primaryAvailable = [] { return secretservice::secretServiceAvailable(); };
    candidates.makeFallback = [&config] { return makePlatformBackend(config); };
    return keyring::core::selectProvider(candidates);
}

keyring::core::IKeyringProvider& defaultProvider()
{
    static const std::unique_ptr<keyring::core::IKeyringProvider> provider{ makeDefaultProvider(
        keyring::core::ProviderConfig::fromEnvironment()) };
    return *provider;
}

} // namespace keyring::providers
