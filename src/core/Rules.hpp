//
// Rules.hpp
//

#ifndef PARLEY_RULES_HPP
#define PARLEY_RULES_HPP

#include <span>
#include <vector>

#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace parley::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Fresh game: seats in canonical order, board already built from its seed.
        virtual auto Initial(std::vector<SeatSpec> seats, Board board, Config const& cfg) const -> GameState = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& state, Action const& a) const -> CheckResult = 0;

        // Mutates the state without checking legality; callers validate first.
        virtual auto Apply(GameState& state, Action const& a) const -> void = 0;

        // Everything the seat in control may do right now.
        virtual auto LegalActions(GameState const& state) const -> std::vector<Action> = 0;
    };

    // Validate (unless told not to) and apply. On violation the state is untouched.
    inline auto Execute(Rules const& rules, GameState& state, Action const& a, bool validate = true)
        -> Rules::CheckResult
    {
        if (validate)
        {
            if (auto const ok = rules.Validate(state, a); !ok.has_value())
            {
                return ok;
            }
        }
        rules.Apply(state, a);
        return {};
    }

    // Projection stored with each snapshot.
    auto MakeView(Rules const& rules, GameState const& state) -> GameView;
}

#endif //PARLEY_RULES_HPP
