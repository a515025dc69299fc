//
// GreedyAi.hpp
//

#ifndef PARLEY_GREEDYAI_HPP
#define PARLEY_GREEDYAI_HPP

#include "Player.hpp"
#include "Types.hpp"

namespace parley::core
{
    // Builds whenever it can, otherwise offers the single swap that moves it
    // closest to its next build (once per turn) and accepts trades that help.
    class GreedyAI final : public Player
    {
    public:
        GreedyAI() = default;

        auto Decide(GameState const& state, std::span<Action const> legal) -> Action override;

        // Resources that count toward the settlement and city costs.
        static auto Progress(ResourceCounts const& hand) noexcept -> uint32_t;
    };
}

#endif //PARLEY_GREEDYAI_HPP
