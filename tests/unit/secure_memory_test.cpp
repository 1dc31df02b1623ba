#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "keyring/security/MemoryWiper.hpp"
#include "keyring/security/ScopeWipe.hpp"
#include "keyring/security/SecureString.hpp"

namespace
{

[[nodiscard]] bool allZero(const std::string& s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return c == '\0'; });
}

static_assert(std::is_same_v<std::allocator_traits<keyring::security::WipingAllocator<char>>::rebind_alloc<int>,
                             keyring::security::WipingAllocator<int>>);

} // namespace

TEST(MemoryWiper, ZerosRawBuffer)
{
    std::array<std::uint32_t, 16> words{};
    words.fill(0xDEADBEEFU);

    keyring::security::secureWipe(words.data(), sizeof(words));

    for (const auto w : words)
    {
        EXPECT_EQ(w, 0U);
    }
}

TEST(MemoryWiper, ZerosStringContentsKeepingLength)
{
    std::string secret{ "hunter2" };
    keyring::security::secureWipe(secret);

    EXPECT_EQ(secret.size(), 7U);
    EXPECT_TRUE(allZero(secret));
}

TEST(MemoryWiper, EmptyInputsAreNoOps)
{
    std::string empty{};
    EXPECT_NO_THROW(keyring::security::secureWipe(empty));
    EXPECT_NO_THROW(keyring::security::secureWipe(nullptr, 16U));
}

TEST(ScopeWipe, WipesOnDestruction)
{
    std::string secret{ "a secret long enough to live on the heap" };
    {
        auto guard{ keyring::security::scopeWipe(secret) };
    }
    EXPECT_TRUE(allZero(secret));
}

TEST(ScopeWipe, ReleaseDisablesWipe)
{
    std::string secret{ "kept" };
    {
        auto guard{ keyring::security::scopeWipe(secret) };
        guard.release();
    }
    EXPECT_EQ(secret, "kept");
}

TEST(ScopeWipe, MoveTransfersWipeResponsibility)
{
    std::string secret{ "moved" };
    {
        auto outer{ keyring::security::scopeWipe(secret) };
        {
            keyring::security::ScopeWipe inner{ std::move(outer) };
        }
        EXPECT_TRUE(allZero(secret));
        secret = "rewritten";
    }
    // The moved-from guard no longer owns the string.
    EXPECT_EQ(secret, "rewritten");
}

TEST(SecureString, AsStringViewEmptyIsSafe)
{
    const keyring::security::SecureString empty{};
    EXPECT_TRUE(keyring::security::asStringView(empty).empty());
    EXPECT_TRUE(keyring::security::toStdString(empty).empty());
}

TEST(SecureString, KeepsEmbeddedNulBytes)
{
    using namespace std::string_literals;
    const auto secret{ keyring::security::secureStringFrom("a\0b"s) };

    EXPECT_EQ(secret.size(), 3U);
    EXPECT_EQ(keyring::security::toStdString(secret), "a\0b"s);
}

TEST(SecureString, SecureResizeShrinksAndPreservesPrefix)
{
    auto secret{ keyring::security::secureStringFrom("abcdef") };
    keyring::security::secureResize(secret, 3U);

    EXPECT_EQ(keyring::security::asStringView(secret), "abc");
}

TEST(SecureString, SecureReleaseFreesStorage)
{
    auto secret{ keyring::security::secureStringFrom("abcdef") };
    keyring::security::secureRelease(secret);

    EXPECT_TRUE(secret.empty());
    EXPECT_EQ(secret.capacity(), 0U);
}

TEST(SecureString, GrowthAcrossReallocationsKeepsContents)
{
    keyring::security::SecureString buffer{};
    for (int i{ 0 }; i < 1000; ++i)
    {
        buffer.push_back(static_cast<char>('a' + (i % 26)));
    }
    ASSERT_EQ(buffer.size(), 1000U);
    EXPECT_EQ(buffer.front(), 'a');
    EXPECT_EQ(buffer.back(), static_cast<char>('a' + (999 % 26)));
}

TEST(SecureString, AllocatorsCompareEqual)
{
    const keyring::security::WipingAllocator<char> a{};
    const keyring::security::WipingAllocator<int> b{ a };
    EXPECT_TRUE(a == b);
}
