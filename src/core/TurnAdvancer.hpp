//
// TurnAdvancer.hpp
//

#ifndef PARLEY_TURNADVANCER_HPP
#define PARLEY_TURNADVANCER_HPP

#include <optional>
#include <vector>

#include "Actions.hpp"
#include "PlayerFactory.hpp"
#include "Rules.hpp"
#include "State.hpp"

namespace parley::core
{
    struct DriveResult
    {
        bool processed{false};
        std::vector<Action> applied; // in application order
        std::vector<Color> forced;   // seats whose response was a forced reject

        explicit operator bool() const noexcept { return processed; }
    };

    // Moves automated seats through an open trade offer so the negotiation
    // never waits on a bot. Humans still answer through the gateway.
    class TurnAdvancer
    {
    public:
        TurnAdvancer(Rules const& rules, PlayerFactory const& players);

        // No-op unless accept/reject responses are being collected. Walks
        // seats in order, stopping at the first human who still owes a response.
        auto Drive(GameState& state) const -> DriveResult;

        // Lets the automated seat in control take a single action.
        // Internal error if that seat is human or its choice is illegal.
        auto BotTick(GameState& state) const -> Action;

    private:
        auto Ask(SeatSpec const& seat, GameState const& state, std::vector<Action> const& legal) const
            -> std::optional<Action>;

        Rules const& rules_;
        PlayerFactory const& players_;
    };
}

#endif //PARLEY_TURNADVANCER_HPP
