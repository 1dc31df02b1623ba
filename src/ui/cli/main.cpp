#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "keyring/core/KeyringErrors.hpp"
#include "keyring/core/Log.hpp"
#include "keyring/core/ProviderConfig.hpp"
#include "keyring/providers/DefaultProvider.hpp"
#include "keyring/security/ScopeWipe.hpp"
#include "keyring/security/SecureString.hpp"

#include <CLI/CLI.hpp>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

namespace
{

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitError{ 1 };
constexpr int g_kExitNotFound{ 2 };

enum class Command : std::uint8_t
{
    None,
    Set,
    Get,
    Delete,
    DeleteAll,
    Shell,
};

struct Arguments final
{
    Command command{ Command::None };
    std::string service;
    std::string user;
    bool fromStdin{ false };

    std::string backend;
    std::string scope;
    std::string collection;
    std::string keyctlTool;
    std::string logLevel;
};

[[nodiscard]] keyring::core::ProviderConfig resolveConfig(const Arguments& args)
{
    auto config{ keyring::core::ProviderConfig::fromEnvironment() };
    if (!args.backend.empty())
    {
        config.backend = keyring::core::parseBackendPreference(args.backend);
    }
    if (!args.scope.empty())
    {
        config.keyctlScope = keyring::core::parseKeyctlScope(args.scope);
    }
    if (!args.collection.empty())
    {
        config.collectionPath = args.collection;
    }
    if (!args.keyctlTool.empty())
    {
        config.keyctlTool = args.keyctlTool;
    }
    return config;
}

int execute(const Arguments& args, keyring::core::IKeyringProvider& provider)
{
    switch (args.command)
    {
    case Command::Set:
    {
        const auto secret{ args.fromStdin ? keyring::ui::cli::readSecretFrom(std::cin)
                                          : keyring::ui::cli::readSecret("Secret: ") };
        provider.setSecret(args.service, args.user, keyring::security::asStringView(secret));
        return g_kExitOk;
    }
    case Command::Get:
    {
        std::string secret{ provider.getSecret(args.service, args.user) };
        auto wipeSecret{ keyring::security::scopeWipe(secret) };
        std::cout << secret << '\n';
        return g_kExitOk;
    }
    case Command::Delete:
        provider.deleteSecret(args.service, args.user);
        return g_kExitOk;
    case Command::DeleteAll:
        provider.deleteAll(args.service);
        return g_kExitOk;
    case Command::Shell:
    {
        keyring::ui::cli::InteractiveShell shell{ provider, std::cin, std::cout, keyring::ui::cli::readSecret };
        return shell.run();
    }
    case Command::None:
        break;
    }
    return g_kExitError;
}

void addPairOptions(CLI::App* sub, Arguments& args)
{
    sub->add_option("service", args.service, "Service name")->required();
    sub->add_option("user", args.user, "User name")->required();
}

} // namespace

int main(int argc, char** argv)
{
    Arguments args{};

    CLI::App app{ "Store, read and delete secrets in the desktop keyring or the kernel keyring" };
    app.require_subcommand(1);

    app.add_option("--backend", args.backend, "auto, secret-service or keyctl");
    app.add_option("--scope", args.scope, "Kernel keyring: session or persistent");
    app.add_option("--collection", args.collection, "Secret Service collection object path");
    app.add_option("--keyctl-tool", args.keyctlTool, "keyctl executable used by delete-all");
    app.add_option("--log-level", args.logLevel, "trace, debug, info, warn, err, critical or off");

    auto* subSet{ app.add_subcommand("set", "Store a secret read from the terminal") };
    addPairOptions(subSet, args);
    subSet->add_flag("--stdin", args.fromStdin, "Read the secret from standard input instead of prompting");
    subSet->callback([&args]() { args.command = Command::Set; });

    auto* subGet{ app.add_subcommand("get", "Print a secret") };
    addPairOptions(subGet, args);
    subGet->callback([&args]() { args.command = Command::Get; });

    auto* subDelete{ app.add_subcommand("delete", "Delete a secret") };
    addPairOptions(subDelete, args);
    subDelete->callback([&args]() { args.command = Command::Delete; });

    auto* subDeleteAll{ app.add_subcommand("delete-all", "Delete every secret of a service") };
    subDeleteAll->add_option("service", args.service, "Service name")->required();
    subDeleteAll->callback([&args]() { args.command = Command::DeleteAll; });

    app.add_subcommand("shell", "Interactive shell")->callback([&args]() { args.command = Command::Shell; });

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e);
    }

    try
    {
        if (!args.logLevel.empty())
        {
            keyring::core::setLogLevel(args.logLevel);
        }
        keyring::ui::cli::lockProcessMemory();

        const auto provider{ keyring::providers::makeDefaultProvider(resolveConfig(args)) };
        return execute(args, *provider);
    }
    catch (const keyring::core::NotFound& e)
    {
        std::cerr << "not found: " << e.what() << '\n';
        return g_kExitNotFound;
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << '\n';
        return g_kExitError;
    }
}
