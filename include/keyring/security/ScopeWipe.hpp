#ifndef INCLUDE_KEYRING_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_KEYRING_SECURITY_SCOPEWIPE_HPP

#include "keyring/security/MemoryWiper.hpp"
#include <string>

namespace keyring::security
{
// Wipes a std::string holding a secret when the guard leaves scope.
// The string must outlive the guard and must not be reallocated while guarded.
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    explicit ScopeWipe(std::string& s) noexcept : m_target{ &s }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_target{ sw.m_target }
    {
        sw.release();
    }

    ~ScopeWipe() noexcept
    {
        if (m_target != nullptr)
        {
            secureWipe(*m_target);
        }
    }

    void release() noexcept
    {
        m_target = nullptr;
    }

private:
    std::string* m_target{ nullptr };
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ s };
}

} // namespace keyring::security

#endif // INCLUDE_KEYRING_SECURITY_SCOPEWIPE_HPP
