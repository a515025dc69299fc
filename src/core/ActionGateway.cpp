//
// ActionGateway.cpp
//

#include "ActionGateway.hpp"

#include <memory>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "Exception.hpp"

namespace parley::core
{
    ActionGateway::ActionGateway(RoomStore& rooms, StateStore& store, Rules const& rules,
                                 TurnAdvancer const& advancer) :
        rooms_{rooms},
        store_{store},
        rules_{rules},
        advancer_{advancer}
    {
    }

    auto ActionGateway::Authorize(GameState const& state, Action const& action, Color const seat) -> void
    {
        if (action.actor != seat)
        {
            PRL_THROW(error::Code::Authorization,
                      fmt::format("Session seat {} cannot act as {}", ToString(seat), ToString(action.actor)));
        }

        // Any seated player who still owes a response may answer an open offer.
        if (state.AwaitingResponses() && IsTradeResponse(action))
        {
            std::optional<SeatIdxT> const idx = state.SeatOf(seat);
            if (idx.has_value() && *idx != state.negotiation->offerer_seat && !state.HasResponded(*idx))
            {
                return;
            }
            PRL_THROW(error::Code::Authorization,
                      fmt::format("{} cannot respond to this offer", ToString(seat)));
        }

        // A decided game has no actor; SubmitAction rejects it after the version check.
        if (!state.winner.has_value() && state.CurrentColor() != seat)
        {
            PRL_THROW(error::Code::Authorization, fmt::format("It is not {}'s turn", ToString(seat)));
        }
    }

    auto ActionGateway::SubmitAction(Session const& session,
                                     ActionPayload const& payload,
                                     std::optional<Version> const expected_version) -> Snapshot
    {
        if (!session.seat.has_value())
        {
            PRL_THROW(error::Code::Authorization, "Spectators cannot submit actions");
        }

        RoomStore::Lease lease = rooms_.Lock(session.room_id);
        Room& room = lease.Get();
        if (!room.started || !room.game_id.has_value())
        {
            PRL_THROW(error::Code::Validation, "Game has not started yet");
        }
        GameId const& game_id = *room.game_id;

        auto decoded = DecodeAction(payload);
        if (!decoded.has_value())
        {
            PRL_THROW(error::Code::Validation, decoded.error().message);
        }
        Action const action = std::move(*decoded);

        Snapshot const latest = store_.GetSnapshot(game_id, std::nullopt);
        Authorize(*latest.state, action, *session.seat);

        if (expected_version.has_value() && *expected_version != latest.version)
        {
            PRL_THROW(error::Code::Conflict,
                      fmt::format("Expected version {} but latest is {}", *expected_version, latest.version));
        }
        if (latest.state->winner.has_value())
        {
            PRL_THROW(error::Code::Validation, "Game is already decided");
        }

        auto next = std::make_shared<GameState>(*latest.state);
        if (auto const ok = Execute(rules_, *next, action); !ok.has_value())
        {
            spdlog::warn("[Gateway] Rejected {} in {}: {}", Describe(action), game_id, error::describe(ok.error()));
            PRL_THROW(error::Code::Validation, error::describe(ok.error()));
        }

        Snapshot snap = store_.AppendSnapshot(game_id, next, MakeView(rules_, *next));
        room.latest_version = snap.version;
        lease.Commit();
        store_.LogEvent(game_id, snap.version, events::ActionApplied,
                        {{"action", Describe(action)}, {"user", session.name}});
        spdlog::info("[Gateway] {} applied {} -> v{}", game_id, Describe(action), snap.version);

        // Room seats are all human today, so this only absorbs responses once rooms seat bots.
        auto advanced = std::make_shared<GameState>(*next);
        DriveResult const drive = advancer_.Drive(*advanced);
        if (drive)
        {
            snap = store_.AppendSnapshot(game_id, advanced, MakeView(rules_, *advanced));
            room.latest_version = snap.version;
            lease.Commit();
            store_.LogEvent(game_id, snap.version, events::BotResponses,
                            {{"count", fmt::format("{}", drive.applied.size())},
                             {"forced", fmt::format("{}", fmt::join(drive.forced | std::views::transform(
                                 [](Color c) { return ToString(c); }), ","))}});
            spdlog::info("[Gateway] {} absorbed {} automated responses -> v{}", game_id, drive.applied.size(),
                         snap.version);
        }
        return snap;
    }
}
