//
// RoomStore.cpp
//

#include "RoomStore.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "Exception.hpp"

namespace parley::core
{
    RoomStore::Lease::Lease(std::shared_ptr<Entry> entry) :
        entry_{std::move(entry)},
        lock_{entry_->row}
    {
        std::scoped_lock lk(entry_->data);
        working_ = entry_->committed;
    }

    auto RoomStore::Lease::Commit() -> void
    {
        working_.updated_at = std::chrono::system_clock::now();
        std::scoped_lock lk(entry_->data);
        entry_->committed = working_;
    }

    auto RoomStore::Insert(Room room) -> void
    {
        auto entry = std::make_shared<Entry>();
        entry->committed = std::move(room);
        std::scoped_lock lk(mtx_);
        auto const [it, inserted] = rooms_.try_emplace(entry->committed.room_id, entry);
        PRL_ASSERT(inserted, "Room id collision");
    }

    auto RoomStore::Find(RoomId const& id) const -> std::shared_ptr<Entry>
    {
        std::scoped_lock lk(mtx_);
        auto const it = rooms_.find(id);
        if (it == rooms_.end())
        {
            PRL_THROW(error::Code::NotFound, fmt::format("Room {} not found", id));
        }
        return it->second;
    }

    auto RoomStore::Get(RoomId const& id) const -> Room
    {
        std::shared_ptr<Entry> const e = Find(id);
        std::scoped_lock lk(e->data);
        return e->committed;
    }

    auto RoomStore::List(std::size_t const limit) const -> std::vector<Room>
    {
        std::vector<std::shared_ptr<Entry>> entries;
        {
            std::scoped_lock lk(mtx_);
            entries.reserve(rooms_.size());
            for (auto const& [id, e] : rooms_) entries.push_back(e);
        }

        std::vector<Room> out;
        out.reserve(entries.size());
        for (auto const& e : entries)
        {
            std::scoped_lock lk(e->data);
            out.push_back(e->committed);
        }
        std::ranges::sort(out, [](Room const& a, Room const& b) { return a.created_at > b.created_at; });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    auto RoomStore::Lock(RoomId const& id) -> Lease
    {
        return Lease{Find(id)};
    }
}
