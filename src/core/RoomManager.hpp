//
// RoomManager.hpp
//

#ifndef PARLEY_ROOMMANAGER_HPP
#define PARLEY_ROOMMANAGER_HPP

#include <optional>
#include <string>
#include <vector>

#include "Room.hpp"
#include "RoomStore.hpp"
#include "Rules.hpp"
#include "SessionRegistry.hpp"
#include "StateStore.hpp"

namespace parley::core
{
    struct JoinResult
    {
        Session session;
        bool is_spectator{false};
        Room room;
    };

    // Room lifecycle and seat assignment. Every mutation (create excepted)
    // runs under the room's lease and commits only on success.
    class RoomManager
    {
    public:
        RoomManager(RoomStore& rooms, SessionRegistry& sessions, StateStore& store,
                    Rules const& rules, Config cfg);

        auto CreateRoom(std::string_view name) -> Room;
        auto ListRooms() const -> std::vector<Room>;
        auto GetRoom(RoomId const& id) const -> Room;

        auto JoinRoom(RoomId const& id, std::string_view name) -> JoinResult;
        auto LeaveRoom(Session const& session) -> Room;
        auto RefreshBoard(Session const& session) -> Room;
        // Returns the bound game id; repeated calls after a start return the same id.
        auto StartRoom(Session const& session) -> GameId;
        auto GetRoomGame(Session const& session, std::optional<Version> version) const -> Snapshot;

    private:
        static auto RequireHost(Room const& room, Session const& session, std::string_view what) -> void;

        RoomStore& rooms_;
        SessionRegistry& sessions_;
        StateStore& store_;
        Rules const& rules_;
        Config cfg_;
    };
}

#endif //PARLEY_ROOMMANAGER_HPP
