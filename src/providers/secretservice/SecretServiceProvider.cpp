#include "keyring/providers/secretservice/SecretServiceProviderFactory.hpp"

#include "GlibHandles.hpp"
#include "keyring/core/KeyringErrors.hpp"
#include "keyring/core/Log.hpp"
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace keyring::providers::secretservice
{
namespace
{

using keyring::core::KeyringError;
using keyring::core::NotFound;
using keyring::core::ServiceUnavailable;
using keyring::core::UnlockFailed;

constexpr const char* g_kSessionInterface{ "org.freedesktop.Secret.Session" };
constexpr const char* g_kLabelProperty{ "org.freedesktop.Secret.Item.Label" };
constexpr const char* g_kAttributesProperty{ "org.freedesktop.Secret.Item.Attributes" };
constexpr const char* g_kContentType{ "text/plain" };

constexpr const char* g_kUserAttribute{ "username" };
constexpr const char* g_kServiceAttribute{ "service" };

[[nodiscard]] GObjectPtr<SecretService> connectToService()
{
    GError* rawError{ nullptr };
    GObjectPtr<SecretService> service{ secret_service_open_sync(SECRET_TYPE_SERVICE, nullptr, SECRET_SERVICE_NONE,
                                                                nullptr, &rawError) };
    const GErrorPtr error{ rawError };
    if (error || !service)
    {
        throw ServiceUnavailable(describeError("secret service: connect failed", error.get()));
    }
    return service;
}

// Owns one Secret Service session for the duration of a call and closes it on every exit path.
class SessionGuard final
{
public:
    explicit SessionGuard(SecretService* service) : m_service(service)
    {
        GError* rawError{ nullptr };
        const gboolean ok{ secret_service_ensure_session_sync(m_service, nullptr, &rawError) };
        const GErrorPtr error{ rawError };
        if (error || ok == FALSE)
        {
            throw ServiceUnavailable(describeError("secret service: open session failed", error.get()));
        }

        const gchar* path{ secret_service_get_session_dbus_path(m_service) };
        if (path == nullptr)
        {
            throw ServiceUnavailable("secret service: daemon did not return a session");
        }
        m_path = path;
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;
    SessionGuard(SessionGuard&&) = delete;
    SessionGuard& operator=(SessionGuard&&) = delete;

    ~SessionGuard() noexcept
    {
        close();
    }

private:
    void close() noexcept
    {
        GDBusProxy* proxy{ G_DBUS_PROXY(m_service) };
        GError* rawError{ nullptr };
        const GVariantPtr reply{ g_dbus_connection_call_sync(g_dbus_proxy_get_connection(proxy),
                                                             g_dbus_proxy_get_name(proxy), m_path.c_str(),
                                                             g_kSessionInterface, "Close", nullptr, nullptr,
                                                             G_DBUS_CALL_FLAGS_NONE, -1, nullptr, &rawError) };
        const GErrorPtr error{ rawError };
        if (error)
        {
            keyring::core::logger().debug("secret service: closing session {} failed: {}", m_path,
                                          error->message != nullptr ? error->message : "unknown error");
        }
    }

    SecretService* m_service;
    std::string m_path;
};

// Search key. The strings are referenced, not copied, by the hash tables built from it.
struct ItemAttributes final
{
    std::string service;
    std::optional<std::string> user;

    [[nodiscard]] GHashTablePtr searchTable() const
    {
        GHashTablePtr table{ g_hash_table_new(g_str_hash, g_str_equal) };
        if (user.has_value())
        {
            g_hash_table_insert(table.get(), const_cast<gchar*>(g_kUserAttribute), const_cast<gchar*>(user->c_str()));
        }
        g_hash_table_insert(table.get(), const_cast<gchar*>(g_kServiceAttribute), const_cast<gchar*>(service.c_str()));
        return table;
    }

    [[nodiscard]] GHashTablePtr itemProperties(const std::string& label) const
    {
        GHashTablePtr props{ g_hash_table_new_full(g_str_hash, g_str_equal, nullptr,
                                                   reinterpret_cast<GDestroyNotify>(g_variant_unref)) };
        g_hash_table_insert(props.get(), const_cast<gchar*>(g_kLabelProperty),
                            g_variant_ref_sink(g_variant_new_string(label.c_str())));

        GVariantBuilder builder{};
        g_variant_builder_init(&builder, G_VARIANT_TYPE("a{ss}"));
        if (user.has_value())
        {
            g_variant_builder_add(&builder, "{ss}", g_kUserAttribute, user->c_str());
        }
        g_variant_builder_add(&builder, "{ss}", g_kServiceAttribute, service.c_str());
        g_hash_table_insert(props.get(), const_cast<gchar*>(g_kAttributesProperty),
                            g_variant_ref_sink(g_variant_builder_end(&builder)));
        return props;
    }
};

[[nodiscard]] std::string itemLabel(std::string_view service, std::string_view user)
{
    std::string label{ "Password for '" };
    label.append(user);
    label.append("' on '");
    label.append(service);
    label.append("'");
    return label;
}

// Unlocks a collection or item, letting the daemon prompt the user if it needs to.
void unlockPath(SecretService* service, const std::string& path)
{
    const gchar* paths[]{ path.c_str(), nullptr };
    gchar** rawUnlocked{ nullptr };
    GError* rawError{ nullptr };
    const gint count{ secret_service_unlock_dbus_paths_sync(service, paths, nullptr, &rawUnlocked, &rawError) };
    const GStrvPtr unlocked{ rawUnlocked };
    const GErrorPtr error{ rawError };
    if (error)
    {
        throw UnlockFailed(describeError("secret service: unlock of " + path + " failed", error.get()));
    }
    if (count < 1)
    {
        throw UnlockFailed("secret service: " + path + " is still locked (prompt dismissed?)");
    }
}

[[nodiscard]] std::vector<std::string> searchCollection(SecretService* service, const std::string& collectionPath,
                                                        const ItemAttributes& attributes)
{
    GError* rawError{ nullptr };
    const GObjectPtr<SecretCollection> collection{ secret_collection_new_for_dbus_path_sync(
        service, collectionPath.c_str(), SECRET_COLLECTION_NONE, nullptr, &rawError) };
    GErrorPtr error{ rawError };
    if (error || !collection)
    {
        throw KeyringError(describeError("secret service: cannot open collection " + collectionPath, error.get()));
    }

    const GHashTablePtr table{ attributes.searchTable() };
    rawError = nullptr;
    const GStrvPtr found{
        secret_collection_search_for_dbus_paths_sync(collection.get(), nullptr, table.get(), nullptr, &rawError)
    };
    error.reset(rawError);
    if (error)
    {
        throw KeyringError(describeError("secret service: search failed", error.get()));
    }

    std::vector<std::string> paths{};
    if (found)
    {
        for (gchar** it{ found.get() }; *it != nullptr; ++it)
        {
            paths.emplace_back(*it);
        }
    }
    return paths;
}

void deleteItem(SecretService* service, const std::string& itemPath)
{
    GError* rawError{ nullptr };
    const gboolean ok{ secret_service_delete_item_dbus_path_sync(service, itemPath.c_str(), nullptr, &rawError) };
    const GErrorPtr error{ rawError };
    if (error || ok == FALSE)
    {
        throw KeyringError(describeError("secret service: delete of " + itemPath + " failed", error.get()));
    }
}

class SecretServiceProvider final : public keyring::core::IKeyringProvider
{
public:
    explicit SecretServiceProvider(std::string collectionPath) : m_collectionPath(std::move(collectionPath))
    {
    }

    void setSecret(std::string_view service, std::string_view user, std::string_view password) override
    {
        const auto svc{ connectToService() };
        const SessionGuard session{ svc.get() };
        unlockPath(svc.get(), m_collectionPath);

        const ItemAttributes attributes{ std::string{ service }, std::string{ user } };
        const GHashTablePtr props{ attributes.itemProperties(itemLabel(service, user)) };
        const SecretValuePtr value{ secret_value_new(password.data(), static_cast<gssize>(password.size()),
                                                     g_kContentType) };

        // Replacement of an item with identical attributes is up to the daemon.
        GError* rawError{ nullptr };
        const GCharPtr itemPath{ secret_service_create_item_dbus_path_sync(svc.get(), m_collectionPath.c_str(),
                                                                           props.get(), value.get(),
                                                                           SECRET_ITEM_CREATE_REPLACE, nullptr,
                                                                           &rawError) };
        const GErrorPtr error{ rawError };
        if (error || !itemPath)
        {
            throw KeyringError(describeError("secret service: create item failed", error.get()));
        }
        keyring::core::logger().debug("secret service: stored item {}", itemPath.get());
    }

    [[nodiscard]] std::string getSecret(std::string_view service, std::string_view user) override
    {
        const auto svc{ connectToService() };
        const SessionGuard session{ svc.get() };
        const std::string item{ findItem(svc.get(), service, user) };

        // Items can be locked independently of their collection.
        unlockPath(svc.get(), item);

        GError* rawError{ nullptr };
        const SecretValuePtr value{ secret_service_get_secret_for_dbus_path_sync(svc.get(), item.c_str(), nullptr,
                                                                                 &rawError) };
        const GErrorPtr error{ rawError };
        if (error || !value)
        {
            throw KeyringError(describeError("secret service: get secret failed", error.get()));
        }

        gsize length{ 0U };
        const gchar* data{ secret_value_get(value.get(), &length) };
        if (data == nullptr || length == 0U)
        {
            return {};
        }
        return std::string{ data, static_cast<std::size_t>(length) };
    }

    void deleteSecret(std::string_view service, std::string_view user) override
    {
        const auto svc{ connectToService() };
        deleteItem(svc.get(), findItem(svc.get(), service, user));
    }

    void deleteAll(std::string_view service) override
    {
        // An empty service would match every item.
        if (service.empty())
        {
            throw NotFound("deleteAll: empty service name");
        }

        const auto svc{ connectToService() };
        unlockPath(svc.get(), m_collectionPath);
        const auto items{ searchCollection(svc.get(), m_collectionPath,
                                           ItemAttributes{ std::string{ service }, std::nullopt }) };
        if (items.empty())
        {
            return;
        }

        // Stops at the first failure; later matches are left in place.
        for (const auto& item : items)
        {
            deleteItem(svc.get(), item);
        }
        keyring::core::logger().debug("secret service: deleted {} item(s) of {}", items.size(), service);
    }

private:
    [[nodiscard]] std::string findItem(SecretService* svc, std::string_view service, std::string_view user) const
    {
        unlockPath(svc, m_collectionPath);
        const auto items{ searchCollection(svc, m_collectionPath,
                                           ItemAttributes{ std::string{ service }, std::string{ user } }) };
        if (items.empty())
        {
            throw NotFound{};
        }
        // Search order is defined by the daemon.
        return items.front();
    }

    const std::string m_collectionPath;
};

} // namespace

std::unique_ptr<keyring::core::IKeyringProvider> makeSecretServiceProvider(std::string collectionPath)
{
    return std::make_unique<SecretServiceProvider>(std::move(collectionPath));
}

bool secretServiceAvailable() noexcept
{
    try
    {
        const auto svc{ connectToService() };
        const SessionGuard session{ svc.get() };
        return true;
    }
    catch (const std::exception& e)
    {
        keyring::core::logger().debug("secret service availability check failed: {}", e.what());
        return false;
    }
}

} // namespace keyring::providers::secretservice
