//
// GameService.hpp
//

#ifndef PARLEY_GAMESERVICE_HPP
#define PARLEY_GAMESERVICE_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ActionPayload.hpp"
#include "Rules.hpp"
#include "StateStore.hpp"
#include "TurnAdvancer.hpp"

namespace parley::core
{
    // Games created directly, outside any room. Nothing serialises two
    // concurrent calls for the same game id: versions stay contiguous but both
    // calls may act on the same base state.
    class GameService
    {
    public:
        GameService(StateStore& store, Rules const& rules, TurnAdvancer const& advancer, Config cfg);

        // 2..4 player kinds, colors in seat order.
        auto CreateGame(std::span<PlayerKind const> kinds) -> GameId;
        auto GetGame(GameId const& id, std::optional<Version> version) const -> Snapshot;
        auto ListGames() const -> std::vector<Summary>;

        // With a payload: apply it. Without: let bots make progress, which
        // requires an open offer or an automated seat in control.
        auto PostAction(GameId const& id, std::optional<ActionPayload> const& payload) -> Snapshot;

        auto DeleteGame(GameId const& id) -> void;
        auto ListEvents(GameId const& id, std::optional<std::string> const& type) const -> std::vector<Event>;

    private:
        auto Append(GameId const& id, GameState const& state) -> Snapshot;
        auto AppendDrive(GameId const& id, GameState const& state, DriveResult const& drive) -> Snapshot;
        auto ApplyPayload(GameId const& id, GameState const& base, ActionPayload const& payload) -> Snapshot;
        auto AdvanceBots(GameId const& id, GameState const& base) -> Snapshot;

        StateStore& store_;
        Rules const& rules_;
        TurnAdvancer const& advancer_;
        Config cfg_;
    };
}

#endif //PARLEY_GAMESERVICE_HPP
