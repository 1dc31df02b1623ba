#ifndef KEYRING_TESTS_TEST_UTILS_PROVIDERCONTRACTSCENARIOS_HPP
#define KEYRING_TESTS_TEST_UTILS_PROVIDERCONTRACTSCENARIOS_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include "keyring/core/KeyringErrors.hpp"
#include <gtest/gtest.h>
#include <string>
#include <string_view>

// Behaviour every backend shares. Each scenario works on its own `service` and removes what it stored,
// so it can run against a keyring the user also relies on.
namespace keyring::test_utils
{

inline void expectRoundTrip(keyring::core::IKeyringProvider& provider, const std::string& service,
                            std::string_view user, std::string_view value)
{
    provider.setSecret(service, user, value);
    EXPECT_EQ(provider.getSecret(service, user), value);
    provider.deleteSecret(service, user);
}

inline void runRoundTripScenario(keyring::core::IKeyringProvider& provider, const std::string& service)
{
    using namespace std::string_literals;

    expectRoundTrip(provider, service, "alice", "line one\nline two\n\nline four");
    expectRoundTrip(provider, service, "bob", "bin\0ary\0"s);
    expectRoundTrip(provider, service, "carol", "p\xC3\xA4ssw\xC3\xB6rd \xE2\x9C\x93 \xF0\x9F\x94\x91");
}

inline void runMissingEntryScenario(keyring::core::IKeyringProvider& provider, const std::string& service)
{
    EXPECT_THROW((void)provider.getSecret(service, "nobody"), keyring::core::NotFound);
    EXPECT_THROW(provider.deleteSecret(service, "nobody"), keyring::core::NotFound);
}

// svc/alice: secret1, then secret2, then delete.
inline void runOverwriteScenario(keyring::core::IKeyringProvider& provider, const std::string& service)
{
    provider.setSecret(service, "alice", "secret1");
    provider.setSecret(service, "alice", "secret2");
    EXPECT_EQ(provider.getSecret(service, "alice"), "secret2");

    provider.deleteSecret(service, "alice");
    EXPECT_THROW((void)provider.getSecret(service, "alice"), keyring::core::NotFound);
}

inline void runDeleteAllScenario(keyring::core::IKeyringProvider& provider, const std::string& service,
                                 const std::string& otherService)
{
    provider.setSecret(service, "alice", "a");
    provider.setSecret(service, "bob", "b");
    provider.setSecret(otherService, "alice", "kept");

    provider.deleteAll(service);

    EXPECT_THROW((void)provider.getSecret(service, "alice"), keyring::core::NotFound);
    EXPECT_THROW((void)provider.getSecret(service, "bob"), keyring::core::NotFound);
    EXPECT_EQ(provider.getSecret(otherService, "alice"), "kept");

    // Nothing left to match: still fine.
    EXPECT_NO_THROW(provider.deleteAll(service));

    provider.deleteSecret(otherService, "alice");
}

inline void runEmptyServiceScenario(keyring::core::IKeyringProvider& provider)
{
    EXPECT_THROW(provider.deleteAll(""), keyring::core::NotFound);
}

} // namespace keyring::test_utils

#endif // KEYRING_TESTS_TEST_UTILS_PROVIDERCONTRACTSCENARIOS_HPP
