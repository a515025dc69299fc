//
// Types.hpp
//

#ifndef PARLEY_TYPES_HPP
#define PARLEY_TYPES_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace parley::core::constants
{
    inline constexpr std::size_t SeatCount = 4;
    inline constexpr std::size_t MinPlayersToStart = 2;
    inline constexpr std::size_t ResourceKinds = 5;
    inline constexpr std::size_t MaxRoomsListed = 100;
    inline constexpr std::size_t MaxGamesListed = 200;
}

namespace parley::core
{
    // Canonical seat order; the first color is the room host.
    enum class Color : uint8_t
    {
        Red = 0,
        Blue,
        White,
        Orange
    };

    inline constexpr std::array<Color, constants::SeatCount> SeatOrder{
        Color::Red, Color::Blue, Color::White, Color::Orange};

    enum class Resource : uint8_t
    {
        Wood = 0,
        Brick,
        Sheep,
        Wheat,
        Ore
    };

    using ResourceCounts = std::array<uint16_t, constants::ResourceKinds>;

    using SeatIdxT = uint8_t;
    using Version = uint64_t;
    using GameId = std::string;
    using RoomId = std::string;
    using Token = std::string;
    using Timestamp = std::chrono::system_clock::time_point;

    struct Config
    {
        uint8_t vp_to_win{10};
        // 0 = draw from std::random_device per game
        uint64_t seed{0};
    };

    auto ToString(Color c) -> std::string_view;
    auto ToString(Resource r) -> std::string_view;
    auto ParseColor(std::string_view s) -> std::optional<Color>;
    auto IsoTime(Timestamp t) -> std::string;

    inline auto Total(ResourceCounts const& rc) -> uint32_t
    {
        uint32_t sum{};
        for (uint16_t const n : rc) sum += n;
        return sum;
    }

    inline auto Covers(ResourceCounts const& hand, ResourceCounts const& need) -> bool
    {
        for (std::size_t i{}; i < constants::ResourceKinds; ++i)
        {
            if (hand[i] < need[i]) return false;
        }
        return true;
    }
}

#endif //PARLEY_TYPES_HPP
