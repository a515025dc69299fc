//
// RandomAi.hpp
//

#ifndef PARLEY_RANDOMAI_HPP
#define PARLEY_RANDOMAI_HPP

#include <random>

#include "Player.hpp"
#include "Types.hpp"

namespace parley::core
{
    class RandomAI final : public Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Decide(GameState const& state, std::span<Action const> legal) -> Action override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //PARLEY_RANDOMAI_HPP
