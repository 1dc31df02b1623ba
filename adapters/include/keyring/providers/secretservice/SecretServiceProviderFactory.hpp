#ifndef INCLUDE_KEYRING_PROVIDERS_SECRETSERVICE_SECRETSERVICEPROVIDERFACTORY_HPP
#define INCLUDE_KEYRING_PROVIDERS_SECRETSERVICE_SECRETSERVICEPROVIDERFACTORY_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include "keyring/core/ProviderConfig.hpp"
#include <memory>
#include <string>

namespace keyring::providers::secretservice
{

// Backend talking to org.freedesktop.secrets over the session bus. Every call opens its own connection and
// session, unlocks `collectionPath` and releases everything before returning.
[[nodiscard]] std::unique_ptr<keyring::core::IKeyringProvider>
makeSecretServiceProvider(std::string collectionPath = std::string{ keyring::core::g_kDefaultCollectionPath });

// Connects to the daemon, opens and closes a session. True if the daemon answered.
[[nodiscard]] bool secretServiceAvailable() noexcept;

} // namespace keyring::providers::secretservice

#endif // INCLUDE_KEYRING_PROVIDERS_SECRETSERVICE_SECRETSERVICEPROVIDERFACTORY_HPP
