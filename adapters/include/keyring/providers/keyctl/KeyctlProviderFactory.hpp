#ifndef INCLUDE_KEYRING_PROVIDERS_KEYCTL_KEYCTLPROVIDERFACTORY_HPP
#define INCLUDE_KEYRING_PROVIDERS_KEYCTL_KEYCTLPROVIDERFACTORY_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include "keyring/core/ProviderConfig.hpp"
#include <memory>
#include <string>

namespace keyring::providers::keyctl
{

// Backend storing secrets as kernel "user" keys named "<service>:<user>" in the session or persistent keyring.
// deleteAll() lists the keyring with `keyctlTool show`; if the tool cannot run, nothing is deleted and the call
// still succeeds.
[[nodiscard]] std::unique_ptr<keyring::core::IKeyringProvider>
makeKeyctlProvider(keyring::core::KeyctlScope scope = keyring::core::KeyctlScope::Session,
                   std::string keyctlTool = std::string{ keyring::core::g_kDefaultKeyctlTool });

// True if the keyring for `scope` can be resolved by this process.
[[nodiscard]] bool keyctlAvailable(keyring::core::KeyctlScope scope) noexcept;

} // namespace keyring::providers::keyctl

#endif // INCLUDE_KEYRING_PROVIDERS_KEYCTL_KEYCTLPROVIDERFACTORY_HPP
