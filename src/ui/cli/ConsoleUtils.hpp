#ifndef KEYRING_UI_CLI_CONSOLEUTILS_HPP
#define KEYRING_UI_CLI_CONSOLEUTILS_HPP

#include "keyring/security/SecureString.hpp"
#include <istream>
#include <string>

namespace keyring::ui::cli
{

void lockProcessMemory() noexcept;

// Prompts on stdout and reads one line from stdin with terminal echo disabled.
[[nodiscard]] keyring::security::SecureString readSecret(const std::string& prompt);

// Reads the whole stream as the secret. A single trailing newline is dropped.
[[nodiscard]] keyring::security::SecureString readSecretFrom(std::istream& in);

} // namespace keyring::ui::cli

#endif // KEYRING_UI_CLI_CONSOLEUTILS_HPP
