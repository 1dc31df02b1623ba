#ifndef KEYRING_TESTS_TEST_UTILS_MOCKKEYRINGPROVIDER_HPP
#define KEYRING_TESTS_TEST_UTILS_MOCKKEYRINGPROVIDER_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include <gmock/gmock.h>
#include <string>
#include <string_view>

namespace keyring::test_utils
{

class MockKeyringProvider : public keyring::core::IKeyringProvider
{
public:
    MOCK_METHOD(void, setSecret, (std::string_view service, std::string_view user, std::string_view password),
                (override));
    MOCK_METHOD(std::string, getSecret, (std::string_view service, std::string_view user), (override));
    MOCK_METHOD(void, deleteSecret, (std::string_view service, std::string_view user), (override));
    MOCK_METHOD(void, deleteAll, (std::string_view service), (override));
};

} // namespace keyring::test_utils

#endif // KEYRING_TESTS_TEST_UTILS_MOCKKEYRINGPROVIDER_HPP
