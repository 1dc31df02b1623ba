#include "ConsoleUtils.hpp"

#include "keyring/security/ScopeWipe.hpp"
#include <iostream>
#include <iterator>
#include <string>

#if defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace keyring::ui::cli
{

namespace
{
void setConsoleEcho(bool enable)
{
    struct termios tty
    {
    };
    // Not a terminal (pipe, test stream): nothing to toggle.
    if (tcgetattr(STDIN_FILENO, &tty) != 0)
    {
        return;
    }
    if (!enable)
    {
        tty.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    }
    else
    {
        tty.c_lflag |= ECHO;
    }
    (void)tcsetattr(STDIN_FILENO, TCSANOW, &tty);
}
} // namespace

void lockProcessMemory() noexcept
{
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    (void)setrlimit(RLIMIT_CORE, &lim);
}

keyring::security::SecureString readSecret(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    setConsoleEcho(false);

    std::string line;
    auto wipeLine{ keyring::security::scopeWipe(line) };
    std::getline(std::cin, line);

    setConsoleEcho(true);
    std::cout << "\n";

    return keyring::security::secureStringFrom(line);
}

keyring::security::SecureString readSecretFrom(std::istream& in)
{
    keyring::security::SecureString secret{};
    std::istreambuf_iterator<char> it{ in };
    const std::istreambuf_iterator<char> end{};
    for (; it != end; ++it)
    {
        secret.push_back(*it);
    }
    if (!secret.empty() && secret.back() == '\n')
    {
        keyring::security::secureResize(secret, secret.size() - 1U);
    }
    return secret;
}

} // namespace keyring::ui::cli
