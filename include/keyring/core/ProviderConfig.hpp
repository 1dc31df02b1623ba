#ifndef INCLUDE_KEYRING_CORE_PROVIDERCONFIG_HPP
#define INCLUDE_KEYRING_CORE_PROVIDERCONFIG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace keyring::core
{

enum class BackendPreference : std::uint8_t
{
    Auto,          // check the Secret Service, fall back to the platform backend
    SecretService, // Secret Service only
    Keyctl,        // kernel keyring only
};

enum class KeyctlScope : std::uint8_t
{
    Session,    // dies with the login session
    Persistent, // per-UID keyring, survives logout, expiry refreshed on access
};

inline constexpr std::string_view g_kDefaultCollectionPath{ "/org/freedesktop/secrets/collection/login" };
inline constexpr std::string_view g_kDefaultKeyctlTool{ "keyctl" };

struct ProviderConfig final
{
    BackendPreference backend{ BackendPreference::Auto };
    KeyctlScope keyctlScope{ KeyctlScope::Session };
    // Executable used to dump a keyring for keyctl deleteAll().
    std::string keyctlTool{ g_kDefaultKeyctlTool };
    // Secret Service collection that receives and is searched for items.
    std::string collectionPath{ g_kDefaultCollectionPath };

    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    // Reads KRC_BACKEND, KRC_KEYCTL_SCOPE, KRC_KEYCTL_TOOL and KRC_SECRET_COLLECTION.
    // Unset or empty variables keep the defaults; unparsable values throw std::invalid_argument.
    [[nodiscard]] static ProviderConfig fromEnvironment();
    [[nodiscard]] static ProviderConfig fromEnvironment(const EnvLookup& lookup);
};

// Accepted spellings: "auto", "secret-service", "keyctl".
[[nodiscard]] BackendPreference parseBackendPreference(std::string_view text);
// Accepted spellings: "session", "persistent".
[[nodiscard]] KeyctlScope parseKeyctlScope(std::string_view text);

[[nodiscard]] std::string_view toString(BackendPreference backend) noexcept;
[[nodiscard]] std::string_view toString(KeyctlScope scope) noexcept;

} // namespace keyring::core

#endif // INCLUDE_KEYRING_CORE_PROVIDERCONFIG_HPP
