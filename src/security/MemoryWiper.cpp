#include "keyring/security/MemoryWiper.hpp"

#include <string.h>

namespace keyring::security
{

void secureWipe(void* data, std::size_t size) noexcept
{
    if (data == nullptr || size == 0U)
    {
        return;
    }
    ::explicit_bzero(data, size);
}

} // namespace keyring::security
