//
// Board.cpp
//

#include "Board.hpp"

#include <algorithm>
#include <array>
#include <random>

#include "Exception.hpp"

namespace parley::core
{
    namespace
    {
        constexpr std::array<uint8_t, 18> BaseNumbers{
            2, 3, 3, 4, 4, 5, 5, 6, 6, 8, 8, 9, 9, 10, 10, 11, 11, 12};

        auto BaseTiles() -> std::vector<std::optional<Resource>>
        {
            std::vector<std::optional<Resource>> out;
            out.reserve(constants::TileCount);
            auto add = [&out](Resource r, std::size_t n)
            {
                for (std::size_t i{}; i < n; ++i) out.emplace_back(r);
            };
            add(Resource::Wood, 4);
            add(Resource::Brick, 3);
            add(Resource::Sheep, 4);
            add(Resource::Wheat, 4);
            add(Resource::Ore, 3);
            out.emplace_back(std::nullopt);
            return out;
        }
    }

    auto BuildBoard(uint64_t const seed) -> Board
    {
        std::mt19937_64 rng{seed};

        std::vector<std::optional<Resource>> resources = BaseTiles();
        std::array<uint8_t, 18> numbers = BaseNumbers;
        std::ranges::shuffle(resources, rng);
        std::ranges::shuffle(numbers, rng);

        Board board{};
        board.seed = seed;
        board.tiles.reserve(resources.size());

        std::size_t next_number{};
        for (std::optional<Resource> const& r : resources)
        {
            Tile t{};
            t.resource = r;
            if (r.has_value())
            {
                t.number = numbers[next_number++];
            }
            board.tiles.push_back(t);
        }
        PRL_ASSERT(next_number == numbers.size(), "Board numbers not fully assigned");
        return board;
    }

    auto GenerateBoardSeed() -> uint64_t
    {
        std::random_device rd;
        std::uniform_int_distribution<uint64_t> dist{1, (uint64_t{1} << 63) - 1};
        return dist(rd);
    }
}
