#ifndef INCLUDE_KEYRING_CORE_PROVIDERSELECTION_HPP
#define INCLUDE_KEYRING_CORE_PROVIDERSELECTION_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include <functional>
#include <memory>

namespace keyring::core
{

using ProviderFactory = std::function<std::unique_ptr<IKeyringProvider>()>;
using AvailabilityCheck = std::function<bool()>;

struct ProviderCandidates final
{
    // Preferred backend; required.
    ProviderFactory makePrimary;
    // Contacts the primary's service once and releases the contact; required.
    AvailabilityCheck primaryAvailable;
    // Platform fallback hook. May be empty or produce nullptr on platforms without one.
    ProviderFactory makeFallback;
};

// Decides which provider backs the public surface:
//  - primary reachable: the primary alone, no fallback wiring;
//  - unreachable, fallback available: CompositeProvider(primary, fallback), keeping the primary first so it is
//    used again as soon as the service comes up;
//  - unreachable, no fallback: the bare primary (operations fail until the service appears).
[[nodiscard]] std::unique_ptr<IKeyringProvider> selectProvider(const ProviderCandidates& candidates);

} // namespace keyring::core

#endif // INCLUDE_KEYRING_CORE_PROVIDERSELECTION_HPP
