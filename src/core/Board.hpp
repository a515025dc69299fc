//
// Board.hpp
//

#ifndef PARLEY_BOARD_HPP
#define PARLEY_BOARD_HPP

#include <optional>
#include <vector>

#include "Types.hpp"

namespace parley::core::constants
{
    inline constexpr std::size_t TileCount = 19;
}

namespace parley::core
{
    struct Tile
    {
        std::optional<Resource> resource; // nullopt = desert
        uint8_t number{0};                // 0 on the desert
    };

    struct Board
    {
        uint64_t seed{};
        std::vector<Tile> tiles;
    };

    // Same seed, same layout. Shuffles the base tile and number templates.
    auto BuildBoard(uint64_t seed) -> Board;

    // Seat owning tile `tile_idx` in a game of `n_seats`.
    inline auto TileOwner(std::size_t tile_idx, std::size_t n_seats) -> SeatIdxT
    {
        return static_cast<SeatIdxT>(tile_idx % n_seats);
    }

    // Uniform in [1, 2^63), from std::random_device.
    auto GenerateBoardSeed() -> uint64_t;
}

#endif //PARLEY_BOARD_HPP
