#ifndef KEYRING_UI_CLI_INTERACTIVESHELL_HPP
#define KEYRING_UI_CLI_INTERACTIVESHELL_HPP

#include "keyring/core/IKeyringProvider.hpp"
#include "keyring/security/SecureString.hpp"

#include <functional>
#include <iostream>
#include <string>

namespace keyring::ui::cli
{

// In tests: returns a pre-determined string.
using SecretReader = std::function<keyring::security::SecureString(const std::string&)>;

class InteractiveShell final
{
public:
    InteractiveShell(keyring::core::IKeyringProvider& provider, std::istream& in, std::ostream& out,
                     SecretReader secretReader);

    int run();

private:
    keyring::core::IKeyringProvider& m_provider;
    std::istream& m_in;
    std::ostream& m_out;
    SecretReader m_secretReader;

    bool m_running{ true };

    void processLine(std::string line);

    void doSet(const std::string& service, const std::string& user);
    void doGet(const std::string& service, const std::string& user);
    void doRm(const std::string& service, const std::string& user);
    void doPurge(const std::string& service);
};

} // namespace keyring::ui::cli

#endif // KEYRING_UI_CLI_INTERACTIVESHELL_HPP
