//
// Types.cpp
//

#include "Types.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace parley::core
{
    auto ToString(Color const c) -> std::string_view
    {
        switch (c)
        {
        case Color::Red: return "RED";
        case Color::Blue: return "BLUE";
        case Color::White: return "WHITE";
        case Color::Orange: return "ORANGE";
        }
        return "UNKNOWN";
    }

    auto ToString(Resource const r) -> std::string_view
    {
        switch (r)
        {
        case Resource::Wood: return "WOOD";
        case Resource::Brick: return "BRICK";
        case Resource::Sheep: return "SHEEP";
        case Resource::Wheat: return "WHEAT";
        case Resource::Ore: return "ORE";
        }
        return "UNKNOWN";
    }

    auto ParseColor(std::string_view const s) -> std::optional<Color>
    {
        for (Color const c : SeatOrder)
        {
            if (ToString(c) == s) return c;
        }
        return std::nullopt;
    }

    auto IsoTime(Timestamp const t) -> std::string
    {
        auto const secs = std::chrono::time_point_cast<std::chrono::seconds>(t);
        auto const micros = std::chrono::duration_cast<std::chrono::microseconds>(t - secs).count();
        std::time_t const tt = std::chrono::system_clock::to_time_t(secs);
        return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}Z", fmt::gmtime(tt), micros);
    }
}
