//
// MemoryStateStore.hpp
//

#ifndef PARLEY_MEMORYSTATESTORE_HPP
#define PARLEY_MEMORYSTATESTORE_HPP

#include <mutex>
#include <unordered_map>

#include "StateStore.hpp"

namespace parley::core
{
    // Process-lifetime store. One mutex covers every table, so each call is
    // atomic on its own.
    class MemoryStateStore final : public StateStore
    {
    public:
        MemoryStateStore() = default;

        auto AppendSnapshot(GameId const& game_id,
                            std::shared_ptr<GameState const> state,
                            GameView view) -> Snapshot override;
        auto GetSnapshot(GameId const& game_id, std::optional<Version> version) const -> Snapshot override;
        auto GetSummary(GameId const& game_id) const -> Summary override;
        auto ListSummaries(std::size_t limit) const -> std::vector<Summary> override;
        auto LogEvent(GameId const& game_id,
                      std::optional<Version> version,
                      std::string_view type,
                      EventPayload payload) -> Event override;
        auto ListEvents(GameId const& game_id,
                        std::optional<std::string> const& type) const -> std::vector<Event> override;
        auto DeleteGame(GameId const& game_id) -> std::size_t override;

    private:
        struct GameRecord
        {
            std::vector<Snapshot> snapshots;
            Summary summary;
            uint64_t touched{}; // tiebreak for equal updated_at
        };

        mutable std::mutex mtx_;
        std::unordered_map<GameId, GameRecord> games_;
        std::unordered_map<GameId, std::vector<Event>> events_;
        uint64_t next_event_id_{1};
        uint64_t touch_counter_{0};
    };
}

#endif //PARLEY_MEMORYSTATESTORE_HPP
