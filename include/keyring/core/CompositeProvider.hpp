#ifndef INCLUDE_KEYRING_CORE_COMPOSITEPROVIDER_HPP
#define INCLUDE_KEYRING_CORE_COMPOSITEPROVIDER_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace keyring::core
{

// Tries `primary` first. When it throws and a fallback is configured, the primary's error is discarded and the
// fallback's outcome is returned instead. Without a fallback the primary's outcome is returned unchanged.
// A NotFound from the primary also goes to the fallback.
class CompositeProvider final : public IKeyringProvider
{
public:
    // `primary` must be non-null; `fallback` may be null.
    CompositeProvider(std::unique_ptr<IKeyringProvider> primary, std::unique_ptr<IKeyringProvider> fallback);

    void setSecret(std::string_view service, std::string_view user, std::string_view password) override;
    [[nodiscard]] std::string getSecret(std::string_view service, std::string_view user) override;
    void deleteSecret(std::string_view service, std::string_view user) override;
    void deleteAll(std::string_view service) override;

    [[nodiscard]] bool hasFallback() const noexcept
    {
        return m_fallback != nullptr;
    }

private:
    const std::unique_ptr<IKeyringProvider> m_primary;
    const std::unique_ptr<IKeyringProvider> m_fallback;
};

} // namespace keyring::core

#endif // INCLUDE_KEYRING_CORE_COMPOSITEPROVIDER_HPP
