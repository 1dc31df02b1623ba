#ifndef INCLUDE_KEYRING_SECURITY_SECURESTRING_HPP
#define INCLUDE_KEYRING_SECURITY_SECURESTRING_HPP

#include "keyring/security/MemoryWiper.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace keyring::security
{

// std::allocator that zeroes every block before giving it back.
template <class T> struct WipingAllocator : std::allocator<T>
{
    using value_type = T;

    template <class U> struct rebind
    {
        using other = WipingAllocator<U>;
    };

    WipingAllocator() noexcept = default;
    template <class U> WipingAllocator(const WipingAllocator<U>& /*other*/) noexcept
    {
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(p, n * sizeof(T));
        std::allocator<T>::deallocate(p, n);
    }
};

template <class T, class U>
constexpr bool operator==(const WipingAllocator<T>& /*lhs*/, const WipingAllocator<U>& /*rhs*/) noexcept
{
    return true;
}

// Scratch storage for secret payloads (kernel key reads, prompt input). Freed storage is zeroed, including the
// old block on every reallocation.
using SecureString = std::vector<char, WipingAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::string toStdString(const SecureString& s)
{
    return std::string{ asStringView(s) };
}

// Shrinking zeroes the dropped tail, which stays inside the allocation.
inline void secureResize(SecureString& s, std::size_t newSize)
{
    if (newSize < s.size())
    {
        secureWipe(s.data() + newSize, s.size() - newSize);
    }
    s.resize(newSize);
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(s.data(), s.size());
    SecureString temp{};
    s.swap(temp);
}

} // namespace keyring::security

#endif // INCLUDE_KEYRING_SECURITY_SECURESTRING_HPP
