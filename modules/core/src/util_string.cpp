#include "util_string.h"

#include <algorithm>
#include <cctype>

namespace tc {

namespace {
constexpr char kWhitespaces[]{" \t\n\r\f\v"};
}

std::string_view str::Trim(std::string_view str)
{
    const auto first = str.find_first_not_of(kWhitespaces);
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = str.find_last_not_of(kWhitespaces);
    return str.substr(first, last - first + 1);
}

std::string str::ToLower(std::string_view str)
{
    std::string lower{str};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

} // namespace tc
