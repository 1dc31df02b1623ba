#ifndef INCLUDE_KEYRING_KEYCTL_COMMANDRUNNER_HPP
#define INCLUDE_KEYRING_KEYCTL_COMMANDRUNNER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyring::keyctl
{

struct CommandResult final
{
    int exitCode{ -1 };
    std::string output;
};

// Runs `argv` through /bin/sh with stderr merged into stdout and waits for it.
// Returns std::nullopt if no process could be started. A missing executable shows up as exit code 127.
[[nodiscard]] std::optional<CommandResult> runCommand(const std::vector<std::string>& argv);

// Single-quotes `arg` for /bin/sh.
[[nodiscard]] std::string shellQuote(std::string_view arg);

} // namespace keyring::keyctl

#endif // INCLUDE_KEYRING_KEYCTL_COMMANDRUNNER_HPP
