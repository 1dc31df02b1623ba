#include "keyring/core/Log.hpp"

#include <cstdlib>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace keyring::core
{
namespace
{

constexpr std::string_view g_kLevelEnv{ "KRC_LOG_LEVEL" };
constexpr spdlog::level::level_enum g_kDefaultLevel{ spdlog::level::warn };

[[nodiscard]] spdlog::level::level_enum parseLevel(std::string_view name)
{
    const std::string n{ name };
    const auto level{ spdlog::level::from_str(n) };
    // from_str() maps unknown names to "off"; only accept "off" when it was asked for.
    if (level == spdlog::level::off && n != "off")
    {
        throw std::invalid_argument("unknown log level: " + n);
    }
    return level;
}

[[nodiscard]] spdlog::level::level_enum levelFromEnvironment() noexcept
{
    const char* value{ std::getenv(std::string{ g_kLevelEnv }.c_str()) };
    if (value == nullptr || *value == '\0')
    {
        return g_kDefaultLevel;
    }
    try
    {
        return parseLevel(value);
    }
    catch (const std::invalid_argument&)
    {
        return g_kDefaultLevel;
    }
}

[[nodiscard]] std::shared_ptr<spdlog::logger> makeLogger()
{
    const std::string name{ g_kLoggerName };
    if (auto existing{ spdlog::get(name) })
    {
        return existing;
    }
    auto created{ spdlog::stderr_color_mt(name) };
    created->set_level(levelFromEnvironment());
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace

spdlog::logger& logger()
{
    static const std::shared_ptr<spdlog::logger> s_logger{ makeLogger() };
    return *s_logger;
}

void setLogLevel(std::string_view levelName)
{
    logger().set_level(parseLevel(levelName));
}

} // namespace keyring::core
