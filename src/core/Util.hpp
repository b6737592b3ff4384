#ifndef TYCOON_UTIL_HPP
#define TYCOON_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace tycoon::core::util
{
    inline auto ToLower(char const c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    // ASCII case-insensitive comparison for player and property names
    inline auto IEquals(std::string_view a, std::string_view b) -> bool
    {
        return a.size() == b.size() &&
            std::ranges::equal(a, b, [](char x, char y) { return ToLower(x) == ToLower(y); });
    }

    inline auto Lowered(std::string_view s) -> std::string
    {
        std::string out{s};
        std::ranges::transform(out, out.begin(), ToLower);
        return out;
    }

    inline auto IsBlank(std::string_view s) -> bool
    {
        return std::ranges::all_of(s, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    }
}

#endif //TYCOON_UTIL_HPP
