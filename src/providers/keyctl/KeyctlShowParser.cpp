#include "keyring/keyctl/KeyctlShowParser.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace keyring::keyctl
{
namespace
{

constexpr std::string_view g_kUserMarker{ "user:" };
constexpr std::string_view g_kWhitespace{ " \t\r" };

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    const auto first{ s.find_first_not_of(g_kWhitespace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ s.find_last_not_of(g_kWhitespace) };
    return s.substr(first, last - first + 1U);
}

} // namespace

std::vector<std::string> parseServiceKeyDescriptions(std::string_view dump, std::string_view service)
{
    std::vector<std::string> descriptions{};
    if (service.empty())
    {
        return descriptions;
    }

    std::string prefix{ service };
    prefix.push_back(':');

    while (!dump.empty())
    {
        const auto eol{ dump.find('\n') };
        const std::string_view line{ dump.substr(0, eol) };
        dump = (eol == std::string_view::npos) ? std::string_view{} : dump.substr(eol + 1U);

        if (line.find(prefix) == std::string_view::npos)
        {
            continue;
        }
        const auto marker{ line.find(g_kUserMarker) };
        if (marker == std::string_view::npos)
        {
            continue;
        }

        const std::string_view description{ trim(line.substr(marker + g_kUserMarker.size())) };
        if (description.starts_with(prefix))
        {
            descriptions.emplace_back(description);
        }
    }
    return descriptions;
}

} // namespace keyring::keyctl
