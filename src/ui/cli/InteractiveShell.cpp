#include "InteractiveShell.hpp"

#include "keyring/core/KeyringErrors.hpp"
#include "keyring/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <string_view>
#include <utility>

namespace keyring::ui::cli
{

namespace
{

[[nodiscard]] std::string_view firstWord(std::string_view line) noexcept
{
    const auto begin{ line.find_first_not_of(" \t") };
    if (begin == std::string_view::npos)
    {
        return {};
    }
    const auto end{ line.find_first_of(" \t", begin) };
    return line.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
}

} // namespace

InteractiveShell::InteractiveShell(keyring::core::IKeyringProvider& provider, std::istream& in, std::ostream& out,
                                   SecretReader secretReader)
    : m_provider(provider), m_in(in), m_out(out), m_secretReader(std::move(secretReader))
{
}

int InteractiveShell::run()
{
    m_out << "KeyringCore shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << "krc> ";

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (firstWord(line).empty())
        {
            continue;
        }

        processLine(line);
    }
    return 0;
}

void InteractiveShell::processLine(std::string line)
{
    // 'help' prints the root help rather than the help of the 'help' subcommand.
    if (firstWord(line) == "help")
    {
        line = "--help";
    }

    CLI::App app{ "KeyringCore shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });

    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    std::string serviceArg;
    std::string userArg;

    auto* subSet = app.add_subcommand("set", "Store a secret (prompts for value)");
    subSet->add_option("service", serviceArg, "Service name")->required();
    subSet->add_option("user", userArg, "User name")->required();
    subSet->callback([&]() { doSet(serviceArg, userArg); });

    auto* subGet = app.add_subcommand("get", "Print a secret");
    subGet->add_option("service", serviceArg, "Service name")->required();
    subGet->add_option("user", userArg, "User name")->required();
    subGet->callback([&]() { doGet(serviceArg, userArg); });

    auto* subRm = app.add_subcommand("rm", "Delete a secret");
    subRm->add_option("service", serviceArg, "Service name")->required();
    subRm->add_option("user", userArg, "User name")->required();
    subRm->callback([&]() { doRm(serviceArg, userArg); });

    auto* subPurge = app.add_subcommand("purge", "Delete every secret of a service");
    subPurge->add_option("service", serviceArg, "Service name")->required();
    subPurge->callback([&]() { doPurge(serviceArg); });

    try
    {
        app.parse(line, false);
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
    catch (const keyring::core::NotFound&)
    {
        m_out << "Error: Secret not found.\n";
    }
    catch (const keyring::core::KeyringError& e)
    {
        m_out << "Error: " << e.what() << "\n";
    }
}

void InteractiveShell::doSet(const std::string& service, const std::string& user)
{
    const auto value{ m_secretReader("Secret: ") };
    m_provider.setSecret(service, user, keyring::security::asStringView(value));
    m_out << "Secret stored.\n";
}

void InteractiveShell::doGet(const std::string& service, const std::string& user)
{
    std::string value{ m_provider.getSecret(service, user) };
    auto wipeValue{ keyring::security::scopeWipe(value) };
    m_out << value << "\n";
}

void InteractiveShell::doRm(const std::string& service, const std::string& user)
{
    m_provider.deleteSecret(service, user);
    m_out << "Secret deleted.\n";
}

void InteractiveShell::doPurge(const std::string& service)
{
    m_provider.deleteAll(service);
    m_out << "Secrets of " << service << " deleted.\n";
}

} // namespace keyring::ui::cli
