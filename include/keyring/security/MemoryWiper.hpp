#ifndef INCLUDE_KEYRING_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_KEYRING_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <string>

namespace keyring::security
{

// Zeroes `size` bytes at `data` with a store the optimizer may not drop.
void secureWipe(void* data, std::size_t size) noexcept;

// Zeroes the characters of a std::string that held a secret. The length is kept.
inline void secureWipe(std::string& s) noexcept
{
    secureWipe(s.data(), s.size());
}

} // namespace keyring::security

#endif // INCLUDE_KEYRING_SECURITY_MEMORYWIPER_HPP
