//
// Invariants.hpp
//

#ifndef PARLEY_INVARIANTS_HPP
#define PARLEY_INVARIANTS_HPP

#include <algorithm>
#include <optional>

#include <fmt/format.h>

#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/StateStore.hpp"

namespace parley::core::debug
{
    // A second layer of checks on top of the rules. Violations throw Internal.
    inline auto CheckState(GameState const& s) -> void
    {
        std::size_t const n = s.SeatCount();
        PRL_ASSERT(n >= constants::MinPlayersToStart && n <= constants::SeatCount, "Seat count out of range");
        PRL_ASSERT(s.hands.size() == n && s.victory_points.size() == n, "Per-seat tables sized wrong");
        PRL_ASSERT(s.turn_idx < n && s.actor_idx < n, "Turn or actor index out of range");

        // 1) Negotiation present exactly when a trade prompt is up
        PRL_ASSERT(s.negotiation.has_value() == (s.prompt != Prompt::PlayTurn),
                   "Negotiation and prompt disagree");

        if (s.negotiation.has_value())
        {
            Negotiation const& neg = *s.negotiation;
            PRL_ASSERT(neg.offerer_seat == s.turn_idx, "Offer made by a seat not holding the turn");
            PRL_ASSERT(neg.responded.size() == n && neg.accepted.size() == n, "Response bitmaps sized wrong");
            PRL_ASSERT(!neg.responded[neg.offerer_seat], "Offerer recorded as responding");
            for (std::size_t i{}; i < n; ++i)
            {
                PRL_ASSERT(!neg.accepted[i] || neg.responded[i], "Acceptance without a response");
            }
            // 2) While collecting, control sits with a seat that still owes a response
            if (s.prompt == Prompt::DecideTrade)
            {
                PRL_ASSERT(s.actor_idx != neg.offerer_seat && !neg.responded[s.actor_idx],
                           "Control with a seat that cannot respond");
            }
            else
            {
                PRL_ASSERT(s.actor_idx == neg.offerer_seat, "Acceptees decided by someone else");
                PRL_ASSERT(std::ranges::any_of(neg.accepted, [](bool b) { return b; }),
                           "Deciding acceptees with nobody accepting");
            }
        }
        else
        {
            PRL_ASSERT(s.actor_idx == s.turn_idx, "Control away from the turn holder outside a trade");
        }

        // 3) A winner holds the target, nobody else does
        for (SeatIdxT i{}; i < n; ++i)
        {
            bool const at_target = s.victory_points[i] >= s.vp_to_win;
            PRL_ASSERT(at_target == (s.winner == std::optional<SeatIdxT>{i}), "Winner and points disagree");
        }
    }

    // Versions 0..latest readable in order, summary matching the newest one.
    inline auto CheckLedger(StateStore const& store, GameId const& game_id) -> void
    {
        Summary const sum = store.GetSummary(game_id);
        for (Version v{}; v <= sum.latest_version; ++v)
        {
            Snapshot const snap = store.GetSnapshot(game_id, v);
            PRL_ASSERT(snap.version == v, fmt::format("Snapshot {} stored under version {}", snap.version, v));
            PRL_ASSERT(snap.state != nullptr, fmt::format("Snapshot {} has no state", v));
            CheckState(*snap.state);
        }

        Snapshot const latest = store.GetSnapshot(game_id, std::nullopt);
        PRL_ASSERT(latest.version == sum.latest_version, "Summary behind the ledger");
        PRL_ASSERT(sum.seat_colors == latest.state->Colors(), "Summary seat colors stale");
        PRL_ASSERT(sum.current_color == latest.state->CurrentColor(), "Summary current color stale");
        PRL_ASSERT(sum.winner == latest.state->WinnerColor(), "Summary winner stale");
    }
}

#endif //PARLEY_INVARIANTS_HPP
