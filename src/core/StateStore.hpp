//
// StateStore.hpp
//

#ifndef PARLEY_STATESTORE_HPP
#define PARLEY_STATESTORE_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "State.hpp"
#include "Types.hpp"

namespace parley::core
{
    // Immutable once appended.
    struct Snapshot
    {
        GameId game_id;
        Version version{};
        std::shared_ptr<GameState const> state;
        GameView view;
        Timestamp created_at{};
    };

    // Denormalised per-game row, rewritten with every append.
    struct Summary
    {
        GameId game_id;
        Version latest_version{};
        std::vector<Color> seat_colors;
        std::optional<Color> current_color;
        std::optional<Color> winner;
        Timestamp created_at{};
        Timestamp updated_at{};
    };

    using EventPayload = std::map<std::string, std::string>;

    struct Event
    {
        uint64_t id{};
        GameId game_id;
        std::optional<Version> version;
        std::string type;
        EventPayload payload;
        Timestamp created_at{};
    };

    namespace events
    {
        inline constexpr std::string_view GameCreated = "GAME_CREATED";
        inline constexpr std::string_view ActionApplied = "ACTION_APPLIED";
        inline constexpr std::string_view BotResponses = "BOT_RESPONSES";
    }

    // Append-only ledger of versioned snapshots, summaries and audit events.
    // Appends for one game are atomic with the summary update, but callers
    // serialise read-modify-write sequences themselves.
    class StateStore
    {
    public:
        virtual ~StateStore() = default;

        // Assigns latest + 1 (0 for a new game). Throws Internal on failure.
        virtual auto AppendSnapshot(GameId const& game_id,
                                    std::shared_ptr<GameState const> state,
                                    GameView view) -> Snapshot = 0;

        // nullopt = latest. NotFound for unknown games or versions.
        virtual auto GetSnapshot(GameId const& game_id, std::optional<Version> version) const -> Snapshot = 0;

        virtual auto GetSummary(GameId const& game_id) const -> Summary = 0;

        // Most recently updated first.
        virtual auto ListSummaries(std::size_t limit) const -> std::vector<Summary> = 0;

        virtual auto LogEvent(GameId const& game_id,
                              std::optional<Version> version,
                              std::string_view type,
                              EventPayload payload) -> Event = 0;

        // Oldest first; `type` filters when present.
        virtual auto ListEvents(GameId const& game_id,
                                std::optional<std::string> const& type) const -> std::vector<Event> = 0;

        // Removes snapshots, summary and events; returns how many rows existed.
        virtual auto DeleteGame(GameId const& game_id) -> std::size_t = 0;
    };
}

#endif //PARLEY_STATESTORE_HPP
