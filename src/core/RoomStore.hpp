//
// RoomStore.hpp
//

#ifndef PARLEY_ROOMSTORE_HPP
#define PARLEY_ROOMSTORE_HPP

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "Room.hpp"

namespace parley::core
{
    class RoomStore
    {
        struct Entry
        {
            std::mutex row;          // held for a whole read-modify-write
            mutable std::mutex data; // guards `committed`
            Room committed;
        };

    public:
        // Exclusive hold on one room. Edits go to a working copy that only
        // becomes visible through Commit(); dropping the lease discards them.
        class Lease
        {
        public:
            Lease(Lease&&) noexcept = default;
            Lease(Lease const&) = delete;
            auto operator=(Lease const&) -> Lease& = delete;

            auto Get() noexcept -> Room& { return working_; }
            auto Get() const noexcept -> Room const& { return working_; }
            auto Commit() -> void;

        private:
            friend class RoomStore;
            explicit Lease(std::shared_ptr<Entry> entry);

            std::shared_ptr<Entry> entry_;
            std::unique_lock<std::mutex> lock_;
            Room working_;
        };

        auto Insert(Room room) -> void;
        auto Get(RoomId const& id) const -> Room;
        // Newest first.
        auto List(std::size_t limit) const -> std::vector<Room>;
        // Blocks until the room is free. NotFound for unknown ids.
        auto Lock(RoomId const& id) -> Lease;

    private:
        auto Find(RoomId const& id) const -> std::shared_ptr<Entry>;

        mutable std::mutex mtx_;
        std::unordered_map<RoomId, std::shared_ptr<Entry>> rooms_;
    };
}

#endif //PARLEY_ROOMSTORE_HPP
