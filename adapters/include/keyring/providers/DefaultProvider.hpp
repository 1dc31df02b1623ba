#ifndef INCLUDE_KEYRING_PROVIDERS_DEFAULTPROVIDER_HPP
#define INCLUDE_KEYRING_PROVIDERS_DEFAULTPROVIDER_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include "keyring/core/ProviderConfig.hpp"
#include <memory>

namespace keyring::providers
{

// Builds the provider for `config`:
//  - Auto: Secret Service, wrapped with the platform backend as fallback when the service is unreachable;
//  - SecretService / Keyctl: that backend alone, no availability check.
// Throws std::invalid_argument if Keyctl is requested on a build without a platform backend.
[[nodiscard]] std::unique_ptr<keyring::core::IKeyringProvider>
makeDefaultProvider(const keyring::core::ProviderConfig& config);

// Process-wide provider built once from ProviderConfig::fromEnvironment() on first use.
[[nodiscard]] keyring::core::IKeyringProvider& defaultProvider();

// Platform fallback hook. One definition per build: the kernel keyring backend on Linux, nullptr elsewhere.
[[nodiscard]] std::unique_ptr<keyring::core::IKeyringProvider>
makePlatformBackend(const keyring::core::ProviderConfig& config);

} // namespace keyring::providers

#endif // INCLUDE_KEYRING_PROVIDERS_DEFAULTPROVIDER_HPP
