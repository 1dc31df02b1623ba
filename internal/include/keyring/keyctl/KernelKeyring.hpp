#ifndef INCLUDE_KEYRING_KEYCTL_KERNELKEYRING_HPP
#define INCLUDE_KEYRING_KEYCTL_KERNELKEYRING_HPP

#include "keyring/security/SecureString.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace keyring::keyctl
{

using KeySerial = std::int32_t;

// A "user" key found in or added to a keyring. Serials are not stable across unlink/re-add.
class KernelKey final
{
public:
    KernelKey(KeySerial id, KeySerial keyring) noexcept : m_id(id), m_keyring(keyring)
    {
    }

    [[nodiscard]] KeySerial id() const noexcept
    {
        return m_id;
    }

    // Queries the payload size, then reads the payload in one pass.
    [[nodiscard]] keyring::security::SecureString read() const;

    // Removes the link from the keyring the key was looked up in.
    void unlink() const;

private:
    KeySerial m_id;
    KeySerial m_keyring;
};

// Thin object wrapper over the add_key/keyctl syscalls for one resolved keyring.
class KernelKeyring final
{
public:
    // The caller's session keyring, created if the process has none yet.
    [[nodiscard]] static KernelKeyring session();
    // The caller's per-UID persistent keyring, created on demand and linked into the session keyring.
    // The kernel refreshes its expiry on every access.
    [[nodiscard]] static KernelKeyring persistent();

    [[nodiscard]] KeySerial id() const noexcept
    {
        return m_id;
    }

    // Finds a "user" key with the exact description linked directly into this keyring. Keys reachable only
    // through a nested keyring (e.g. the persistent keyring linked into the session one) are not returned.
    [[nodiscard]] std::optional<KernelKey> search(const std::string& description) const;

    // Adds a "user" key. An existing key with the same description in this keyring is updated by the kernel.
    KernelKey add(const std::string& description, std::string_view payload) const;

private:
    explicit KernelKeyring(KeySerial id) noexcept : m_id(id)
    {
    }

    KeySerial m_id;
};

} // namespace keyring::keyctl

#endif // INCLUDE_KEYRING_KEYCTL_KERNELKEYRING_HPP
