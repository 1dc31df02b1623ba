#include "keyring/keyctl/KernelKeyring.hpp"

#include "keyring/core/KeyringErrors.hpp"
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

#if !defined(__linux__)
#error "Kernel keyring backend requires Linux"
#endif

#include <linux/keyctl.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace keyring::keyctl
{
namespace
{

using keyring::core::KeyringError;
using keyring::core::ServiceUnavailable;
using keyring::core::StorageRejected;

constexpr const char* g_kUserKeyType{ "user" };

[[nodiscard]] std::string errnoMessage(const char* what, int err)
{
    std::string msg{ what };
    msg.append(": ");
    msg.append(std::strerror(err));
    return msg;
}

[[nodiscard]] long keyctlCall(int operation, unsigned long arg2, unsigned long arg3 = 0UL, unsigned long arg4 = 0UL,
                              unsigned long arg5 = 0UL) noexcept
{
    return ::syscall(SYS_keyctl, operation, arg2, arg3, arg4, arg5);
}

[[nodiscard]] bool isMissingKeyError(int err) noexcept
{
    return err == ENOKEY || err == EKEYEXPIRED || err == EKEYREVOKED;
}

// Serials linked directly into `keyring`, in link order.
[[nodiscard]] std::vector<KeySerial> linkedSerials(KeySerial keyring)
{
    std::vector<KeySerial> serials{};
    for (;;)
    {
        const std::size_t capacity{ serials.size() * sizeof(KeySerial) };
        const long size{ keyctlCall(KEYCTL_READ, static_cast<unsigned long>(keyring),
                                    reinterpret_cast<unsigned long>(serials.data()), capacity) };
        if (size < 0)
        {
            throw KeyringError(errnoMessage("keyctl: listing keyring failed", errno));
        }

        const auto bytes{ static_cast<std::size_t>(size) };
        serials.resize(bytes / sizeof(KeySerial));
        if (bytes <= capacity)
        {
            return serials;
        }
    }
}

struct KeyDescription final
{
    std::string type;
    std::string description;
};

// KEYCTL_DESCRIBE yields "type;uid;gid;perm;description". std::nullopt if the key vanished or is not viewable.
[[nodiscard]] std::optional<KeyDescription> describeKey(KeySerial id)
{
    std::string buffer{};
    for (;;)
    {
        const long size{ keyctlCall(KEYCTL_DESCRIBE, static_cast<unsigned long>(id),
                                    reinterpret_cast<unsigned long>(buffer.data()), buffer.size()) };
        if (size <= 0)
        {
            return std::nullopt;
        }
        const auto needed{ static_cast<std::size_t>(size) };
        if (needed <= buffer.size())
        {
            buffer.resize(needed - 1U); // trailing NUL
            break;
        }
        buffer.resize(needed);
    }

    std::size_t pos{ 0U };
    for (int field{ 0 }; field < 4; ++field)
    {
        pos = buffer.find(';', pos);
        if (pos == std::string::npos)
        {
            return std::nullopt;
        }
        ++pos;
    }
    return KeyDescription{ buffer.substr(0, buffer.find(';')), buffer.substr(pos) };
}

} // namespace

keyring::security::SecureString KernelKey::read() const
{
    keyring::security::SecureString payload{};
    // The key can grow between the size query and the read; retry with the new size.
    for (;;)
    {
        const long size{ keyctlCall(KEYCTL_READ, static_cast<unsigned long>(m_id),
                                    reinterpret_cast<unsigned long>(payload.data()), payload.size()) };
        if (size < 0)
        {
            const int err{ errno };
            if (isMissingKeyError(err))
            {
                throw keyring::core::NotFound{};
            }
            throw KeyringError(errnoMessage("keyctl: read failed", err));
        }

        const auto needed{ static_cast<std::size_t>(size) };
        if (needed <= payload.size())
        {
            keyring::security::secureResize(payload, needed);
            return payload;
        }
        keyring::security::secureResize(payload, needed);
    }
}

void KernelKey::unlink() const
{
    if (keyctlCall(KEYCTL_UNLINK, static_cast<unsigned long>(m_id), static_cast<unsigned long>(m_keyring)) < 0)
    {
        const int err{ errno };
        if (isMissingKeyError(err) || err == ENOENT)
        {
            throw keyring::core::NotFound{};
        }
        throw KeyringError(errnoMessage("keyctl: unlink failed", err));
    }
}

KernelKeyring KernelKeyring::session()
{
    const long id{ keyctlCall(KEYCTL_GET_KEYRING_ID, static_cast<unsigned long>(KEY_SPEC_SESSION_KEYRING), 1UL) };
    if (id < 0)
    {
        throw ServiceUnavailable(errnoMessage("keyctl: session keyring unavailable", errno));
    }
    return KernelKeyring{ static_cast<KeySerial>(id) };
}

KernelKeyring KernelKeyring::persistent()
{
    // uid -1 selects the caller's own persistent keyring.
    const long id{ keyctlCall(KEYCTL_GET_PERSISTENT, static_cast<unsigned long>(-1L),
                              static_cast<unsigned long>(KEY_SPEC_SESSION_KEYRING)) };
    if (id < 0)
    {
        throw ServiceUnavailable(errnoMessage("keyctl: persistent keyring unavailable", errno));
    }
    return KernelKeyring{ static_cast<KeySerial>(id) };
}

std::optional<KernelKey> KernelKeyring::search(const std::string& description) const
{
    for (const KeySerial serial : linkedSerials(m_id))
    {
        const auto described{ describeKey(serial) };
        if (described && described->type == g_kUserKeyType && described->description == description)
        {
            return KernelKey{ serial, m_id };
        }
    }
    return std::nullopt;
}

KernelKey KernelKeyring::add(const std::string& description, std::string_view payload) const
{
    const long id{ ::syscall(SYS_add_key, g_kUserKeyType, description.c_str(), payload.data(), payload.size(),
                             static_cast<KeySerial>(m_id)) };
    if (id < 0)
    {
        const int err{ errno };
        throw StorageRejected(errnoMessage("keyctl: add_key rejected", err));
    }
    return KernelKey{ static_cast<KeySerial>(id), m_id };
}

} // namespace keyring::keyctl
