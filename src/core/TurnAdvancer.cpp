//
// TurnAdvancer.cpp
//

#include "TurnAdvancer.hpp"

#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Exception.hpp"

namespace parley::core
{
    TurnAdvancer::TurnAdvancer(Rules const& rules, PlayerFactory const& players) :
        rules_{rules},
        players_{players}
    {
    }

    auto TurnAdvancer::Ask(SeatSpec const& seat, GameState const& state, std::vector<Action> const& legal) const
        -> std::optional<Action>
    {
        try
        {
            std::unique_ptr<Player> p = players_.Create(seat, state.dice_seed ^ state.action_count);
            return p->Decide(state, legal);
        }
        catch (error::Error const& e)
        {
            spdlog::warn("[TurnAdvancer] {} decision failed: {}", ToString(seat.color), e);
        }
        catch (std::exception const& e)
        {
            spdlog::warn("[TurnAdvancer] {} decision failed: {}", ToString(seat.color), e.what());
        }
        return std::nullopt;
    }

    auto TurnAdvancer::Drive(GameState& state) const -> DriveResult
    {
        DriveResult res{};
        if (!state.AwaitingResponses()) return res;

        SeatIdxT const offerer = state.negotiation->offerer_seat;

        for (SeatIdxT seat{}; seat < state.SeatCount(); ++seat)
        {
            if (!state.AwaitingResponses()) break;
            if (seat == offerer || state.HasResponded(seat)) continue;

            SeatSpec const spec = state.seats[seat];
            if (!IsBot(spec.kind)) break;

            state.actor_idx = seat;
            std::vector<Action> const legal = rules_.LegalActions(state);
            std::optional<Action> choice = Ask(spec, state, legal);

            bool forced{false};
            if (!choice.has_value() || choice->actor != spec.color || !IsTradeResponse(*choice))
            {
                if (choice.has_value())
                {
                    spdlog::warn("[TurnAdvancer] {} answered an offer with {}", ToString(spec.color),
                                 Describe(*choice));
                }
                choice = ForcedReject(spec.color);
                forced = true;
            }

            if (auto const ok = Execute(rules_, state, *choice); !ok.has_value())
            {
                spdlog::warn("[TurnAdvancer] {} response rejected ({}); forcing reject",
                             ToString(spec.color), error::describe(ok.error()));
                choice = ForcedReject(spec.color);
                forced = true;
                rules_.Apply(state, *choice);
            }

            res.processed = true;
            res.applied.push_back(*choice);
            if (forced) res.forced.push_back(spec.color);
        }

        if (res.processed)
        {
            spdlog::debug("[TurnAdvancer] Applied {} automated responses ({} forced)", res.applied.size(),
                          res.forced.size());
        }
        return res;
    }

    auto TurnAdvancer::BotTick(GameState& state) const -> Action
    {
        std::optional<Color> const current = state.CurrentColor();
        PRL_ASSERT(current.has_value(), "Bot tick on a finished game");
        SeatSpec const spec = state.seats[state.actor_idx];
        if (!IsBot(spec.kind))
        {
            PRL_THROW(error::Code::Internal, fmt::format("Bot tick for human seat {}", ToString(spec.color)));
        }

        std::vector<Action> const legal = rules_.LegalActions(state);
        PRL_ASSERT(!legal.empty(), "Automated seat has no legal action");
        std::unique_ptr<Player> p = players_.Create(spec, state.dice_seed ^ state.action_count);
        Action const chosen = p->Decide(state, legal);

        if (auto const ok = Execute(rules_, state, chosen); !ok.has_value())
        {
            PRL_THROW(error::Code::Internal,
                      fmt::format("Bot {} chose an illegal action: {}", Describe(chosen),
                                  error::describe(ok.error())));
        }
        return chosen;
    }
}
