//
// MemoryStateStore.cpp
//

#include "MemoryStateStore.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "Exception.hpp"

namespace parley::core
{
    auto MemoryStateStore::AppendSnapshot(GameId const& game_id,
                                          std::shared_ptr<GameState const> state,
                                          GameView view) -> Snapshot
    {
        PRL_ASSERT(state != nullptr, "AppendSnapshot called without a state");
        Timestamp const now = std::chrono::system_clock::now();

        std::scoped_lock lk(mtx_);
        auto [it, inserted] = games_.try_emplace(game_id);
        GameRecord& rec = it->second;

        Snapshot snap{};
        snap.game_id = game_id;
        snap.version = inserted ? 0 : rec.summary.latest_version + 1;
        snap.created_at = now;
        snap.view = std::move(view);

        Summary next = rec.summary;
        if (inserted)
        {
            next.game_id = game_id;
            next.created_at = now;
        }
        next.latest_version = snap.version;
        next.seat_colors = state->Colors();
        next.current_color = state->CurrentColor();
        next.winner = state->WinnerColor();
        next.updated_at = now;

        snap.state = std::move(state);
        rec.snapshots.push_back(snap);
        rec.summary = std::move(next);
        rec.touched = ++touch_counter_;
        return snap;
    }

    auto MemoryStateStore::GetSnapshot(GameId const& game_id, std::optional<Version> const version) const -> Snapshot
    {
        std::scoped_lock lk(mtx_);
        auto const it = games_.find(game_id);
        if (it == games_.end())
        {
            PRL_THROW(error::Code::NotFound, fmt::format("Game {} not found", game_id));
        }
        std::vector<Snapshot> const& snaps = it->second.snapshots;
        if (!version.has_value()) return snaps.back();
        if (*version >= snaps.size())
        {
            PRL_THROW(error::Code::NotFound, fmt::format("Game {} has no version {}", game_id, *version));
        }
        return snaps[*version];
    }

    auto MemoryStateStore::GetSummary(GameId const& game_id) const -> Summary
    {
        std::scoped_lock lk(mtx_);
        auto const it = games_.find(game_id);
        if (it == games_.end())
        {
            PRL_THROW(error::Code::NotFound, fmt::format("Game {} not found", game_id));
        }
        return it->second.summary;
    }

    auto MemoryStateStore::ListSummaries(std::size_t const limit) const -> std::vector<Summary>
    {
        std::vector<std::pair<uint64_t, Summary>> rows;
        {
            std::scoped_lock lk(mtx_);
            rows.reserve(games_.size());
            for (auto const& [id, rec] : games_) rows.emplace_back(rec.touched, rec.summary);
        }
        std::ranges::sort(rows, [](auto const& a, auto const& b)
        {
            if (a.second.updated_at != b.second.updated_at) return a.second.updated_at > b.second.updated_at;
            return a.first > b.first;
        });

        std::vector<Summary> out;
        out.reserve(std::min(limit, rows.size()));
        for (auto& row : rows)
        {
            if (out.size() == limit) break;
            out.push_back(std::move(row.second));
        }
        return out;
    }

    auto MemoryStateStore::LogEvent(GameId const& game_id,
                                    std::optional<Version> const version,
                                    std::string_view const type,
                                    EventPayload payload) -> Event
    {
        Event ev{};
        ev.game_id = game_id;
        ev.version = version;
        ev.type = std::string{type};
        ev.payload = std::move(payload);
        ev.created_at = std::chrono::system_clock::now();

        std::scoped_lock lk(mtx_);
        ev.id = next_event_id_++;
        events_[game_id].push_back(ev);
        return ev;
    }

    auto MemoryStateStore::ListEvents(GameId const& game_id,
                                      std::optional<std::string> const& type) const -> std::vector<Event>
    {
        std::scoped_lock lk(mtx_);
        std::vector<Event> out;
        auto const it = events_.find(game_id);
        if (it == events_.end()) return out;
        for (Event const& ev : it->second)
        {
            if (type.has_value() && ev.type != *type) continue;
            out.push_back(ev);
        }
        return out;
    }

    auto MemoryStateStore::DeleteGame(GameId const& game_id) -> std::size_t
    {
        std::scoped_lock lk(mtx_);
        std::size_t removed{};
        if (auto const it = games_.find(game_id); it != games_.end())
        {
            removed += it->second.snapshots.size() + 1; // + summary row
            games_.erase(it);
        }
        if (auto const it = events_.find(game_id); it != events_.end())
        {
            removed += it->second.size();
            events_.erase(it);
        }
        return removed;
    }
}
