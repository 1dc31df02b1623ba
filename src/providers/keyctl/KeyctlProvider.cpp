#include "keyring/providers/keyctl/KeyctlProviderFactory.hpp"

#include "keyring/core/KeyringErrors.hpp"
#include "keyring/core/Log.hpp"
#include "keyring/keyctl/CommandRunner.hpp"
#include "keyring/keyctl/KernelKeyring.hpp"
#include "keyring/keyctl/KeyctlShowParser.hpp"
#include "keyring/security/SecureString.hpp"
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace keyring::providers::keyctl
{
namespace
{

using keyring::core::KeyctlScope;
using keyring::core::NotFound;
using keyring::core::StorageRejected;
using keyring::keyctl::KernelKeyring;

// Largest payload the kernel accepts for a "user" key.
constexpr std::size_t g_kMaxUserKeyPayload{ 32767U };

[[nodiscard]] std::string keyDescription(std::string_view service, std::string_view user)
{
    std::string description{ service };
    description.push_back(':');
    description.append(user);
    return description;
}

[[nodiscard]] KernelKeyring resolveKeyring(KeyctlScope scope)
{
    return scope == KeyctlScope::Persistent ? KernelKeyring::persistent() : KernelKeyring::session();
}

class KeyctlProvider final : public keyring::core::IKeyringProvider
{
public:
    KeyctlProvider(KeyctlScope scope, std::string keyctlTool) : m_scope(scope), m_keyctlTool(std::move(keyctlTool))
    {
    }

    void setSecret(std::string_view service, std::string_view user, std::string_view password) override
    {
        // The kernel refuses these payloads; refuse before touching an existing key.
        if (password.empty())
        {
            throw StorageRejected("keyctl: empty secrets cannot be stored");
        }
        if (password.size() > g_kMaxUserKeyPayload)
        {
            throw StorageRejected("keyctl: secret exceeds " + std::to_string(g_kMaxUserKeyPayload) + " bytes");
        }

        const KernelKeyring ring{ resolveKeyring(m_scope) };
        const std::string description{ keyDescription(service, user) };
        if (const auto existing{ ring.search(description) })
        {
            try
            {
                existing->unlink();
            }
            catch (const keyring::core::KeyringError& e)
            {
                keyring::core::logger().debug("keyctl: unlinking old {} failed: {}", description, e.what());
            }
        }
        (void)ring.add(description, password);
    }

    [[nodiscard]] std::string getSecret(std::string_view service, std::string_view user) override
    {
        const KernelKeyring ring{ resolveKeyring(m_scope) };
        const auto key{ ring.search(keyDescription(service, user)) };
        if (!key)
        {
            throw NotFound{};
        }
        const keyring::security::SecureString payload{ key->read() };
        return keyring::security::toStdString(payload);
    }

    void deleteSecret(std::string_view service, std::string_view user) override
    {
        const KernelKeyring ring{ resolveKeyring(m_scope) };
        const auto key{ ring.search(keyDescription(service, user)) };
        if (!key)
        {
            throw NotFound{};
        }
        key->unlink();
    }

    void deleteAll(std::string_view service) override
    {
        if (service.empty())
        {
            throw NotFound("deleteAll: empty service name");
        }

        const KernelKeyring ring{ resolveKeyring(m_scope) };
        const std::string target{ m_scope == KeyctlScope::Persistent ? std::to_string(ring.id()) : "@s" };
        const auto result{ keyring::keyctl::runCommand({ m_keyctlTool, "show", target }) };
        if (!result)
        {
            keyring::core::logger().warn("keyctl: could not start '{}'; nothing deleted for {}", m_keyctlTool,
                                         service);
            return;
        }
        if (result->exitCode != 0)
        {
            keyring::core::logger().warn("keyctl: '{} show {}' exited with {}; nothing deleted for {}", m_keyctlTool,
                                         target, result->exitCode, service);
            return;
        }

        // Best effort: keys that disappear or refuse to unlink are skipped.
        std::size_t removed{ 0U };
        for (const auto& description : keyring::keyctl::parseServiceKeyDescriptions(result->output, service))
        {
            try
            {
                if (const auto key{ ring.search(description) })
                {
                    key->unlink();
                    ++removed;
                }
            }
            catch (const keyring::core::KeyringError& e)
            {
                keyring::core::logger().debug("keyctl: skipping {}: {}", description, e.what());
            }
        }
        keyring::core::logger().debug("keyctl: deleted {} key(s) of {}", removed, service);
    }

private:
    const KeyctlScope m_scope;
    const std::string m_keyctlTool;
};

} // namespace

std::unique_ptr<keyring::core::IKeyringProvider> makeKeyctlProvider(KeyctlScope scope, std::string keyctlTool)
{
    return std::make_unique<KeyctlProvider>(scope, std::move(keyctlTool));
}

bool keyctlAvailable(KeyctlScope scope) noexcept
{
    try
    {
        (void)resolveKeyring(scope);
        return true;
    }
    catch (const std::exception& e)
    {
        keyring::core::logger().debug("keyctl availability check failed: {}", e.what());
        return false;
    }
}

} // namespace keyring::providers::keyctl
