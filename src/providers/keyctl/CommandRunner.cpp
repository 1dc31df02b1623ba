#include "keyring/keyctl/CommandRunner.hpp"

#include <array>
#include <cstdio>
#include <memory>
#include <string>
#include <sys/wait.h>

namespace keyring::keyctl
{
namespace
{

struct PipeCloser
{
    void operator()(std::FILE* pipe) const noexcept
    {
        if (pipe != nullptr)
        {
            (void)::pclose(pipe);
        }
    }
};

using PipePtr = std::unique_ptr<std::FILE, PipeCloser>;

} // namespace

std::string shellQuote(std::string_view arg)
{
    std::string quoted{ "'" };
    for (const char c : arg)
    {
        if (c == '\'')
        {
            quoted.append("'\\''");
        }
        else
        {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::optional<CommandResult> runCommand(const std::vector<std::string>& argv)
{
    if (argv.empty())
    {
        return std::nullopt;
    }

    std::string command{};
    for (const auto& arg : argv)
    {
        if (!command.empty())
        {
            command.push_back(' ');
        }
        command.append(shellQuote(arg));
    }
    command.append(" 2>&1");

    PipePtr pipe{ ::popen(command.c_str(), "r") };
    if (!pipe)
    {
        return std::nullopt;
    }

    CommandResult result{};
    std::array<char, 4096> buffer{};
    std::size_t n{ 0U };
    while ((n = std::fread(buffer.data(), 1U, buffer.size(), pipe.get())) > 0U)
    {
        result.output.append(buffer.data(), n);
    }

    const int status{ ::pclose(pipe.release()) };
    if (status == -1)
    {
        return std::nullopt;
    }
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace keyring::keyctl
