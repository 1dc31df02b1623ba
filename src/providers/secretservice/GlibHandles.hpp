#ifndef KEYRING_PROVIDERS_SECRETSERVICE_GLIBHANDLES_HPP
#define KEYRING_PROVIDERS_SECRETSERVICE_GLIBHANDLES_HPP

#ifndef SECRET_API_SUBJECT_TO_CHANGE
#define SECRET_API_SUBJECT_TO_CHANGE
#endif

#include <gio/gio.h>
#include <glib.h>
#include <libsecret/secret.h>
#include <libsecret/secret-unstable.h>
#include <memory>
#include <string>
#include <string_view>

namespace keyring::providers::secretservice
{

struct GObjectDeleter final
{
    void operator()(gpointer object) const noexcept
    {
        if (object != nullptr)
        {
            g_object_unref(object);
        }
    }
};

struct GErrorDeleter final
{
    void operator()(GError* error) const noexcept
    {
        if (error != nullptr)
        {
            g_error_free(error);
        }
    }
};

struct GHashTableDeleter final
{
    void operator()(GHashTable* table) const noexcept
    {
        if (table != nullptr)
        {
            g_hash_table_unref(table);
        }
    }
};

struct GStrvDeleter final
{
    void operator()(gchar** strv) const noexcept
    {
        g_strfreev(strv);
    }
};

struct GFreeDeleter final
{
    void operator()(gchar* str) const noexcept
    {
        g_free(str);
    }
};

struct GVariantDeleter final
{
    void operator()(GVariant* variant) const noexcept
    {
        if (variant != nullptr)
        {
            g_variant_unref(variant);
        }
    }
};

struct SecretValueDeleter final
{
    void operator()(SecretValue* value) const noexcept
    {
        if (value != nullptr)
        {
            secret_value_unref(value);
        }
    }
};

template <class T> using GObjectPtr = std::unique_ptr<T, GObjectDeleter>;
using GErrorPtr = std::unique_ptr<GError, GErrorDeleter>;
using GHashTablePtr = std::unique_ptr<GHashTable, GHashTableDeleter>;
using GStrvPtr = std::unique_ptr<gchar*, GStrvDeleter>;
using GCharPtr = std::unique_ptr<gchar, GFreeDeleter>;
using GVariantPtr = std::unique_ptr<GVariant, GVariantDeleter>;
using SecretValuePtr = std::unique_ptr<SecretValue, SecretValueDeleter>;

[[nodiscard]] inline std::string describeError(std::string_view what, const GError* error)
{
    std::string out{ what };
    out.append(": ");
    out.append((error != nullptr && error->message != nullptr) ? error->message : "unknown error");
    return out;
}

} // namespace keyring::providers::secretservice

#endif // KEYRING_PROVIDERS_SECRETSERVICE_GLIBHANDLES_HPP
