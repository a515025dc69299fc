//
// Util.hpp
//

#ifndef PARLEY_UTIL_HPP
#define PARLEY_UTIL_HPP

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace parley::core::util
{
    // 128 random bits as 32 lowercase hex chars; used for tokens and ids.
    inline auto RandomHex128() -> std::string
    {
        thread_local std::random_device rd;
        std::array<uint32_t, 4> words{};
        for (uint32_t& w : words) w = rd();
        return fmt::format("{:08x}{:08x}{:08x}{:08x}", words[0], words[1], words[2], words[3]);
    }

    inline auto Trim(std::string_view s) -> std::string
    {
        constexpr std::string_view ws = " \t\r\n";
        auto const first = s.find_first_not_of(ws);
        if (first == std::string_view::npos) return {};
        auto const last = s.find_last_not_of(ws);
        return std::string{s.substr(first, last - first + 1)};
    }
}

#endif //PARLEY_UTIL_HPP
