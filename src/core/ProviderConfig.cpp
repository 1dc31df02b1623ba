#include "keyring/core/ProviderConfig.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace keyring::core
{
namespace
{

constexpr std::string_view g_kBackendEnv{ "KRC_BACKEND" };
constexpr std::string_view g_kScopeEnv{ "KRC_KEYCTL_SCOPE" };
constexpr std::string_view g_kToolEnv{ "KRC_KEYCTL_TOOL" };
constexpr std::string_view g_kCollectionEnv{ "KRC_SECRET_COLLECTION" };

[[nodiscard]] std::optional<std::string> processEnv(std::string_view name)
{
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
}

[[nodiscard]] std::optional<std::string> nonEmpty(const ProviderConfig::EnvLookup& lookup, std::string_view name)
{
    auto value{ lookup(name) };
    if (!value.has_value() || value->empty())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

BackendPreference parseBackendPreference(std::string_view text)
{
    if (text == "auto")
    {
        return BackendPreference::Auto;
    }
    if (text == "secret-service")
    {
        return BackendPreference::SecretService;
    }
    if (text == "keyctl")
    {
        return BackendPreference::Keyctl;
    }
    throw std::invalid_argument("unknown backend: " + std::string{ text });
}

KeyctlScope parseKeyctlScope(std::string_view text)
{
    if (text == "session")
    {
        return KeyctlScope::Session;
    }
    if (text == "persistent")
    {
        return KeyctlScope::Persistent;
    }
    throw std::invalid_argument("unknown keyctl scope: " + std::string{ text });
}

std::string_view toString(BackendPreference backend) noexcept
{
    switch (backend)
    {
    case BackendPreference::Auto:
        return "auto";
    case BackendPreference::SecretService:
        return "secret-service";
    case BackendPreference::Keyctl:
        return "keyctl";
    }
    return "unknown";
}

std::string_view toString(KeyctlScope scope) noexcept
{
    switch (scope)
    {
    case KeyctlScope::Session:
        return "session";
    case KeyctlScope::Persistent:
        return "persistent";
    }
    return "unknown";
}

ProviderConfig ProviderConfig::fromEnvironment()
{
    return fromEnvironment(processEnv);
}

ProviderConfig ProviderConfig::fromEnvironment(const EnvLookup& lookup)
{
    ProviderConfig config{};
    if (const auto backend{ nonEmpty(lookup, g_kBackendEnv) })
    {
        config.backend = parseBackendPreference(*backend);
    }
    if (const auto scope{ nonEmpty(lookup, g_kScopeEnv) })
    {
        config.keyctlScope = parseKeyctlScope(*scope);
    }
    if (auto tool{ nonEmpty(lookup, g_kToolEnv) })
    {
        config.keyctlTool = std::move(*tool);
    }
    if (auto collection{ nonEmpty(lookup, g_kCollectionEnv) })
    {
        config.collectionPath = std::move(*collection);
    }
    return config;
}

} // namespace keyring::core
