//
// Player.hpp
//

#ifndef PARLEY_PLAYER_HPP
#define PARLEY_PLAYER_HPP

#include <memory>
#include <span>

#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"

namespace parley::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the turn advancer for the seat in control.
        // `legal` is never empty; bots may still return anything.
        virtual auto Decide(GameState const& state, std::span<Action const> legal) -> Action = 0;

        virtual auto IsBot() const noexcept -> bool { return true; }
    };

    // Humans act through the gateway; reaching this is a driver bug.
    class HumanPlayer final : public Player
    {
    public:
        auto Decide(GameState const&, std::span<Action const>) -> Action override
        {
            PRL_THROW(error::Code::Internal, "Human seat asked to decide automatically");
        }

        auto IsBot() const noexcept -> bool override { return false; }
    };
}
#endif //PARLEY_PLAYER_HPP
