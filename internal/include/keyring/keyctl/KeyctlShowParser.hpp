#ifndef INCLUDE_KEYRING_KEYCTL_KEYCTLSHOWPARSER_HPP
#define INCLUDE_KEYRING_KEYCTL_KEYCTLSHOWPARSER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace keyring::keyctl
{

// Extracts the descriptions of "user" keys belonging to `service` from `keyctl show` output.
// Lines look like:
//   " 812345678 --alswrv   1000  1000   \_ user: service:username"
// The trimmed text after the first "user:" is the description; it is kept when it starts with "<service>:".
// Returned in the order the tool printed them.
[[nodiscard]] std::vector<std::string> parseServiceKeyDescriptions(std::string_view dump, std::string_view service);

} // namespace keyring::keyctl

#endif // INCLUDE_KEYRING_KEYCTL_KEYCTLSHOWPARSER_HPP
