//
// State.cpp
//

#include "State.hpp"

#include "Rules.hpp"

namespace parley::core
{
    auto GameState::SeatOf(Color const c) const -> std::optional<SeatIdxT>
    {
        for (SeatIdxT i{}; i < seats.size(); ++i)
        {
            if (seats[i].color == c) return i;
        }
        return std::nullopt;
    }

    auto GameState::CurrentColor() const -> std::optional<Color>
    {
        if (winner.has_value() || seats.empty()) return std::nullopt;
        return seats[actor_idx].color;
    }

    auto GameState::WinnerColor() const -> std::optional<Color>
    {
        if (!winner.has_value()) return std::nullopt;
        return seats[*winner].color;
    }

    auto GameState::Colors() const -> std::vector<Color>
    {
        std::vector<Color> out;
        out.reserve(seats.size());
        for (SeatSpec const& s : seats) out.push_back(s.color);
        return out;
    }

    auto GameState::HasResponded(SeatIdxT const seat) const -> bool
    {
        return negotiation.has_value() && seat < negotiation->responded.size() && negotiation->responded[seat];
    }

    auto IsBot(PlayerKind const k) noexcept -> bool
    {
        return k != PlayerKind::Human;
    }

    auto ToString(PlayerKind const k) -> std::string_view
    {
        switch (k)
        {
        case PlayerKind::Human: return "HUMAN";
        case PlayerKind::Random: return "RANDOM";
        case PlayerKind::Greedy: return "GREEDY";
        }
        return "UNKNOWN";
    }

    auto ParsePlayerKind(std::string_view const s) -> std::optional<PlayerKind>
    {
        for (PlayerKind const k : {PlayerKind::Human, PlayerKind::Random, PlayerKind::Greedy})
        {
            if (ToString(k) == s) return k;
        }
        return std::nullopt;
    }

    auto MakeView(Rules const& rules, GameState const& state) -> GameView
    {
        GameView v{};
        v.seats.reserve(state.SeatCount());
        for (SeatIdxT i{}; i < state.SeatCount(); ++i)
        {
            v.seats.push_back(SeatView{
                .color = state.seats[i].color,
                .is_bot = IsBot(state.seats[i].kind),
                .resources = state.hands[i],
                .victory_points = state.victory_points[i]});
        }
        v.current_color = state.CurrentColor();
        v.prompt = state.prompt;
        v.rolled = state.rolled;
        v.last_roll = state.last_roll;
        v.winner = state.WinnerColor();
        v.turn_number = state.turn_number;

        if (state.negotiation.has_value())
        {
            Negotiation const& neg = *state.negotiation;
            NegotiationView nv{};
            nv.offerer = state.seats[neg.offerer_seat].color;
            nv.offer = neg.offer;
            nv.request = neg.request;
            for (SeatIdxT i{}; i < state.SeatCount(); ++i)
            {
                if (neg.responded[i]) nv.responded.push_back(state.seats[i].color);
                if (neg.accepted[i]) nv.accepted.push_back(state.seats[i].color);
            }
            v.negotiation = std::move(nv);
        }

        v.playable_actions = rules.LegalActions(state);
        return v;
    }
}
