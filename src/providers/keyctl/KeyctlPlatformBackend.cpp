#include "keyring/providers/DefaultProvider.hpp"

#include "keyring/providers/keyctl/KeyctlProviderFactory.hpp"

namespace keyring::providers
{

std::unique_ptr<keyring::core::IKeyringProvider> makePlatformBackend(const keyring::core::ProviderConfig& config)
{
    return keyctl::makeKeyctlProvider(config.keyctlScope, config.keyctlTool);
}

} // namespace keyring::providers
