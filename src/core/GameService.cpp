//
// GameService.cpp
//

#include "GameService.hpp"

#include <memory>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "Exception.hpp"
#include "Util.hpp"

namespace parley::core
{
    GameService::GameService(StateStore& store, Rules const& rules, TurnAdvancer const& advancer, Config cfg) :
        store_{store},
        rules_{rules},
        advancer_{advancer},
        cfg_{cfg}
    {
    }

    auto GameService::Append(GameId const& id, GameState const& state) -> Snapshot
    {
        auto stored = std::make_shared<GameState const>(state);
        return store_.AppendSnapshot(id, stored, MakeView(rules_, *stored));
    }

    auto GameService::AppendDrive(GameId const& id, GameState const& state, DriveResult const& drive) -> Snapshot
    {
        Snapshot const snap = Append(id, state);
        store_.LogEvent(id, snap.version, events::BotResponses,
                        {{"count", fmt::format("{}", drive.applied.size())},
                         {"forced", fmt::format("{}", fmt::join(drive.forced | std::views::transform(
                             [](Color c) { return ToString(c); }), ","))}});
        return snap;
    }

    auto GameService::CreateGame(std::span<PlayerKind const> const kinds) -> GameId
    {
        if (kinds.size() < constants::MinPlayersToStart || kinds.size() > constants::SeatCount)
        {
            PRL_THROW(error::Code::Validation,
                      fmt::format("A game needs {} to {} players, got {}", constants::MinPlayersToStart,
                                  constants::SeatCount, kinds.size()));
        }

        std::vector<SeatSpec> seats;
        std::vector<std::string_view> names;
        for (std::size_t i{}; i < kinds.size(); ++i)
        {
            seats.push_back(SeatSpec{SeatOrder[i], kinds[i]});
            names.push_back(ToString(kinds[i]));
        }

        uint64_t const seed = cfg_.seed != 0 ? cfg_.seed : GenerateBoardSeed();
        GameId const id = util::RandomHex128();
        GameState const state = rules_.Initial(std::move(seats), BuildBoard(seed), cfg_);
        Snapshot const snap = Append(id, state);
        store_.LogEvent(id, snap.version, events::GameCreated, {{"players", fmt::format("{}", fmt::join(names, ","))}});

        spdlog::info("[Games] Created game {} ({})", id, fmt::join(names, ","));
        return id;
    }

    auto GameService::GetGame(GameId const& id, std::optional<Version> const version) const -> Snapshot
    {
        return store_.GetSnapshot(id, version);
    }

    auto GameService::ListGames() const -> std::vector<Summary>
    {
        return store_.ListSummaries(constants::MaxGamesListed);
    }

    auto GameService::ApplyPayload(GameId const& id, GameState const& base, ActionPayload const& payload) -> Snapshot
    {
        auto decoded = DecodeAction(payload);
        if (!decoded.has_value())
        {
            PRL_THROW(error::Code::Validation, decoded.error().message);
        }
        Action const action = std::move(*decoded);

        GameState next = base;
        if (auto const ok = Execute(rules_, next, action); !ok.has_value())
        {
            spdlog::warn("[Games] Rejected {} in {}: {}", Describe(action), id, error::describe(ok.error()));
            PRL_THROW(error::Code::Validation, error::describe(ok.error()));
        }
        Snapshot snap = Append(id, next);
        store_.LogEvent(id, snap.version, events::ActionApplied, {{"action", Describe(action)}});

        if (DriveResult const drive = advancer_.Drive(next); drive)
        {
            snap = AppendDrive(id, next, drive);
        }
        return snap;
    }

    auto GameService::AdvanceBots(GameId const& id, GameState const& base) -> Snapshot
    {
        GameState next = base;
        if (DriveResult const drive = advancer_.Drive(next); drive)
        {
            return AppendDrive(id, next, drive);
        }

        if (!IsBot(next.seats[next.actor_idx].kind))
        {
            PRL_THROW(error::Code::Validation, "action payload required when it's a human player's turn");
        }

        Action const chosen = advancer_.BotTick(next);
        Snapshot snap = Append(id, next);
        store_.LogEvent(id, snap.version, events::ActionApplied, {{"action", Describe(chosen)}, {"bot", "true"}});

        // An offer from a bot opens a negotiation the other bots can settle now.
        if (DriveResult const drive = advancer_.Drive(next); drive)
        {
            snap = AppendDrive(id, next, drive);
        }
        return snap;
    }

    auto GameService::PostAction(GameId const& id, std::optional<ActionPayload> const& payload) -> Snapshot
    {
        Snapshot const latest = store_.GetSnapshot(id, std::nullopt);
        if (latest.state->winner.has_value())
        {
            return latest;
        }
        if (payload.has_value())
        {
            return ApplyPayload(id, *latest.state, *payload);
        }
        return AdvanceBots(id, *latest.state);
    }

    auto GameService::DeleteGame(GameId const& id) -> void
    {
        if (store_.DeleteGame(id) == 0)
        {
            PRL_THROW(error::Code::NotFound, fmt::format("Game {} not found", id));
        }
        spdlog::info("[Games] Deleted game {}", id);
    }

    auto GameService::ListEvents(GameId const& id, std::optional<std::string> const& type) const
        -> std::vector<Event>
    {
        return store_.ListEvents(id, type);
    }
}
