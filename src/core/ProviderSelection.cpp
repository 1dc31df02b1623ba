#include "keyring/core/ProviderSelection.hpp"

#include "keyring/core/CompositeProvider.hpp"
#include "keyring/core/Log.hpp"
#include <stdexcept>
#include <utility>

namespace keyring::core
{

std::unique_ptr<IKeyringProvider> selectProvider(const ProviderCandidates& candidates)
{
    if (!candidates.makePrimary || !candidates.primaryAvailable)
    {
        throw std::invalid_argument("selectProvider: primary factory and availability check are required");
    }

    if (candidates.primaryAvailable())
    {
        logger().info("secret service reachable, using it without fallback");
        return candidates.makePrimary();
    }

    std::unique_ptr<IKeyringProvider> fallback{};
    if (candidates.makeFallback)
    {
        fallback = candidates.makeFallback();
    }

    if (!fallback)
    {
        logger().warn("secret service unreachable and no fallback backend available");
        return candidates.makePrimary();
    }

    logger().info("secret service unreachable, chaining platform fallback behind it");
    return std::make_unique<CompositeProvider>(candidates.makePrimary(), std::move(fallback));
}

} // namespace keyring::core
