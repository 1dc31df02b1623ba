#include "keyring/core/CompositeProvider.hpp"

#include "keyring/core/Log.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace keyring::core
{
namespace
{

template <class Op>
auto withFallback(IKeyringProvider& primary, IKeyringProvider* fallback, std::string_view opName, const Op& op)
{
    try
    {
        return op(primary);
    }
    catch (const std::exception& e)
    {
        if (fallback == nullptr)
        {
            throw;
        }
        logger().debug("{}: primary provider failed ({}), trying fallback", opName, e.what());
    }
    return op(*fallback);
}

} // namespace

CompositeProvider::CompositeProvider(std::unique_ptr<IKeyringProvider> primary,
                                     std::unique_ptr<IKeyringProvider> fallback)
    : m_primary(std::move(primary)), m_fallback(std::move(fallback))
{
    if (!m_primary)
    {
        throw std::invalid_argument("CompositeProvider: primary provider is required");
    }
}

void CompositeProvider::setSecret(std::string_view service, std::string_view user, std::string_view password)
{
    withFallback(*m_primary, m_fallback.get(), "setSecret",
                 [&](IKeyringProvider& p) { p.setSecret(service, user, password); });
}

std::string CompositeProvider::getSecret(std::string_view service, std::string_view user)
{
    return withFallback(*m_primary, m_fallback.get(), "getSecret",
                        [&](IKeyringProvider& p) { return p.getSecret(service, user); });
}

void CompositeProvider::deleteSecret(std::string_view service, std::string_view user)
{
    withFallback(*m_primary, m_fallback.get(), "deleteSecret",
                 [&](IKeyringProvider& p) { p.deleteSecret(service, user); });
}

void CompositeProvider::deleteAll(std::string_view service)
{
    withFallback(*m_primary, m_fallback.get(), "deleteAll", [&](IKeyringProvider& p) { p.deleteAll(service); });
}

} // namespace keyring::core
