#ifndef INCLUDE_KEYRING_CORE_LOG_HPP
#define INCLUDE_KEYRING_CORE_LOG_HPP

#include <memory>
#include <spdlog/logger.h>
#include <string_view>

namespace keyring::core
{

inline constexpr std::string_view g_kLoggerName{ "keyring" };

// Shared "keyring" logger writing to stderr. Created on first use; the initial level comes from KRC_LOG_LEVEL
// (spdlog level names, default "warn").
[[nodiscard]] spdlog::logger& logger();

// Overrides the level, e.g. from a command line flag. Unknown names throw std::invalid_argument.
void setLogLevel(std::string_view levelName);

} // namespace keyring::core

#endif // INCLUDE_KEYRING_CORE_LOG_HPP
