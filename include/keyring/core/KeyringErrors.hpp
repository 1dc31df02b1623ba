#ifndef INCLUDE_KEYRING_CORE_KEYRINGERRORS_HPP
#define INCLUDE_KEYRING_CORE_KEYRINGERRORS_HPP

#include <stdexcept>

namespace keyring::core
{

// Base of every failure reported by a provider.
class KeyringError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// No record exists for the exact (service, user) pair, or deleteAll() was given an empty service.
class NotFound final : public KeyringError
{
public:
    NotFound() : KeyringError("secret not found in keyring")
    {
    }
    using KeyringError::KeyringError;
};

// The backing store could not be reached (bus connection, session setup, keyring lookup).
class ServiceUnavailable final : public KeyringError
{
public:
    using KeyringError::KeyringError;
};

// A collection or item stayed locked: unlock refused, or the prompt was dismissed.
class UnlockFailed final : public KeyringError
{
public:
    using KeyringError::KeyringError;
};

// The store refused the payload, e.g. an empty value for a kernel "user" key.
class StorageRejected final : public KeyringError
{
public:
    using KeyringError::KeyringError;
};

} // namespace keyring::core

#endif // INCLUDE_KEYRING_CORE_KEYRINGERRORS_HPP
