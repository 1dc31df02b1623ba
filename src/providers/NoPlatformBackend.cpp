#include "keyring/providers/DefaultProvider.hpp"

namespace keyring::providers
{

std::unique_ptr<keyring::core::IKeyringProvider> makePlatformBackend(const keyring::core::ProviderConfig& /*config*/)
{
    return nullptr;
}

} // namespace keyring::providers
