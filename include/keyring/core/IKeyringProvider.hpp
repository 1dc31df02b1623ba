#ifndef INCLUDE_KEYRING_CORE_IKEYRINGPROVIDER_HPP
#define INCLUDE_KEYRING_CORE_IKEYRINGPROVIDER_HPP

#include <string>
#include <string_view>

namespace keyring::core
{

// Capability implemented by every secret backend and by the composite.
// Implementations hold no connection between calls; failures are reported as keyring::core::KeyringError
// subtypes (see KeyringErrors.hpp).
class IKeyringProvider
{
public:
    IKeyringProvider() = default;
    IKeyringProvider(const IKeyringProvider&) = delete;
    IKeyringProvider& operator=(const IKeyringProvider&) = delete;
    IKeyringProvider(IKeyringProvider&&) = delete;
    IKeyringProvider& operator=(IKeyringProvider&&) = delete;
    virtual ~IKeyringProvider() = default;

    // Stores `password` for (service, user), replacing any previous value.
    virtual void setSecret(std::string_view service, std::string_view user, std::string_view password) = 0;

    // Throws NotFound if no record exists for the exact pair.
    [[nodiscard]] virtual std::string getSecret(std::string_view service, std::string_view user) = 0;

    // Removes the single record for the pair. Throws NotFound if absent.
    virtual void deleteSecret(std::string_view service, std::string_view user) = 0;

    // Removes every record of `service` for all users.
    // Throws NotFound for an empty service; returns normally when nothing matched.
    virtual void deleteAll(std::string_view service) = 0;
};

} // namespace keyring::core

#endif // INCLUDE_KEYRING_CORE_IKEYRINGPROVIDER_HPP
