//
// RoomManager.cpp
//

#include "RoomManager.hpp"

#include <memory>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Exception.hpp"
#include "Util.hpp"

namespace parley::core
{
    RoomManager::RoomManager(RoomStore& rooms, SessionRegistry& sessions, StateStore& store,
                             Rules const& rules, Config cfg) :
        rooms_{rooms},
        sessions_{sessions},
        store_{store},
        rules_{rules},
        cfg_{cfg}
    {
    }

    auto RoomManager::RequireHost(Room const& room, Session const& session, std::string_view what) -> void
    {
        if (session.seat != room.HostColor())
        {
            PRL_THROW(error::Code::Authorization, fmt::format("Only the host can {}", what));
        }
    }

    auto RoomManager::CreateRoom(std::string_view const name) -> Room
    {
        Room room{};
        room.room_id = util::RandomHex128();
        room.name = util::Trim(name);
        if (room.name.empty()) room.name = "Room";
        for (Color const c : SeatOrder) room.seats.push_back(Seat{c, std::nullopt});
        room.board_seed = GenerateBoardSeed();
        room.created_at = std::chrono::system_clock::now();
        room.updated_at = room.created_at;

        rooms_.Insert(room);
        spdlog::info("[Rooms] Created room {} '{}'", room.room_id, room.name);
        return room;
    }

    auto RoomManager::ListRooms() const -> std::vector<Room>
    {
        return rooms_.List(constants::MaxRoomsListed);
    }

    auto RoomManager::GetRoom(RoomId const& id) const -> Room
    {
        return rooms_.Get(id);
    }

    auto RoomManager::JoinRoom(RoomId const& id, std::string_view const raw_name) -> JoinResult
    {
        std::string name = util::Trim(raw_name);
        if (name.empty())
        {
            PRL_THROW(error::Code::Validation, "Name must not be blank");
        }

        RoomStore::Lease lease = rooms_.Lock(id);
        Room& room = lease.Get();

        std::optional<Color> seat = room.SeatNamed(name);
        if (seat.has_value())
        {
            spdlog::info("[Rooms] {} reconnected to {} as {}", name, room.room_id, ToString(*seat));
        }
        else if (!room.started)
        {
            if (Seat* free = room.FirstEmptySeat(); free != nullptr)
            {
                free->user_name = name;
                seat = free->color;
                lease.Commit();
                spdlog::info("[Rooms] {} took seat {} in {}", name, ToString(*seat), room.room_id);
            }
        }

        JoinResult res{};
        res.session = sessions_.Issue(std::move(name), room.room_id, seat);
        res.is_spectator = !seat.has_value();
        res.room = room;
        return res;
    }

    auto RoomManager::LeaveRoom(Session const& session) -> Room
    {
        RoomStore::Lease lease = rooms_.Lock(session.room_id);
        Room& room = lease.Get();

        if (room.started && session.seat.has_value())
        {
            PRL_THROW(error::Code::Validation, "Cannot leave a started game while seated");
        }
        if (session.seat.has_value())
        {
            if (Seat* s = room.FindSeat(*session.seat); s != nullptr) s->user_name.reset();
            lease.Commit();
        }
        sessions_.Revoke(session.token);
        spdlog::info("[Rooms] {} left {}", session.name, room.room_id);
        return room;
    }

    auto RoomManager::RefreshBoard(Session const& session) -> Room
    {
        RoomStore::Lease lease = rooms_.Lock(session.room_id);
        Room& room = lease.Get();

        RequireHost(room, session, "refresh the board");
        if (room.started)
        {
            PRL_THROW(error::Code::Validation, "Board cannot change after the game started");
        }
        room.board_seed = GenerateBoardSeed();
        lease.Commit();
        spdlog::debug("[Rooms] Board of {} reseeded to {}", room.room_id, room.board_seed);
        return room;
    }

    auto RoomManager::StartRoom(Session const& session) -> GameId
    {
        RoomStore::Lease lease = rooms_.Lock(session.room_id);
        Room& room = lease.Get();

        RequireHost(room, session, "start the game");
        if (room.started && room.game_id.has_value())
        {
            return *room.game_id;
        }
        if (room.OccupiedCount() < constants::MinPlayersToStart)
        {
            PRL_THROW(error::Code::Validation,
                      fmt::format("At least {} players are required to start", constants::MinPlayersToStart));
        }

        std::vector<SeatSpec> seats;
        for (Seat const& s : room.seats)
        {
            if (s.user_name.has_value()) seats.push_back(SeatSpec{s.color, PlayerKind::Human});
        }

        GameId const game_id = util::RandomHex128();
        auto state = std::make_shared<GameState>(rules_.Initial(std::move(seats), BuildBoard(room.board_seed), cfg_));
        GameView view = MakeView(rules_, *state);
        Snapshot const snap = store_.AppendSnapshot(game_id, std::move(state), std::move(view));
        store_.LogEvent(game_id, snap.version, events::GameCreated, {{"room_id", room.room_id}});

        room.started = true;
        room.game_id = game_id;
        room.latest_version = snap.version;
        lease.Commit();

        spdlog::info("[Rooms] Room {} started game {} with {} players", room.room_id, game_id,
                     room.OccupiedCount());
        return game_id;
    }

    auto RoomManager::GetRoomGame(Session const& session, std::optional<Version> const version) const -> Snapshot
    {
        Room const room = rooms_.Get(session.room_id);
        if (!room.started || !room.game_id.has_value())
        {
            PRL_THROW(error::Code::Validation, "Game has not started yet");
        }
        return store_.GetSnapshot(*room.game_id, version);
    }
}
