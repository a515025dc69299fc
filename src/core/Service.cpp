//
// Service.cpp
//

#include "Service.hpp"

#include <fmt/format.h>

#include "Exception.hpp"

namespace parley::core
{
    Service::Service(StateStore& store, Rules const& rules, PlayerFactory const& players, Config cfg) :
        store_{store},
        advancer_{rules, players},
        rooms_{room_store_, sessions_, store, rules, cfg},
        gateway_{room_store_, store, rules, advancer_},
        games_{store, rules, advancer_, cfg}
    {
    }

    auto Service::RequireSession(std::optional<Token> const& token, std::optional<RoomId> const& room_id) const
        -> Session
    {
        if (!token.has_value() || token->empty())
        {
            PRL_THROW(error::Code::Auth, "Session token required");
        }
        std::optional<Session> s = sessions_.Lookup(*token);
        if (!s.has_value())
        {
            PRL_THROW(error::Code::Auth, "Invalid session token");
        }
        if (room_id.has_value() && s->room_id != *room_id)
        {
            PRL_THROW(error::Code::Authorization, "Session belongs to another room");
        }
        return *std::move(s);
    }

    auto Service::PeekSession(std::optional<Token> const& token, RoomId const& room_id) const
        -> std::optional<Session>
    {
        if (!token.has_value() || token->empty()) return std::nullopt;
        return RequireSession(token, room_id);
    }

    auto Service::CreateRoom(std::string_view const name) -> RoomView
    {
        return MakeRoomView(rooms_.CreateRoom(name), std::nullopt);
    }

    auto Service::ListRooms() const -> std::vector<RoomView>
    {
        std::vector<RoomView> out;
        for (Room const& r : rooms_.ListRooms()) out.push_back(MakeRoomView(r, std::nullopt));
        return out;
    }

    auto Service::JoinRoom(RoomId const& room_id, std::string_view const name) -> JoinView
    {
        JoinResult res = rooms_.JoinRoom(room_id, name);
        JoinView v{};
        v.token = res.session.token;
        v.seat = res.session.seat;
        v.is_spectator = res.is_spectator;
        v.room = MakeRoomView(res.room, res.session.seat);
        return v;
    }

    auto Service::RoomStatus(RoomId const& room_id, std::optional<Token> const& token) const -> RoomView
    {
        std::optional<Session> const s = PeekSession(token, room_id);
        Room const room = rooms_.GetRoom(room_id);
        return MakeRoomView(room, s.has_value() ? s->seat : std::nullopt);
    }

    auto Service::LeaveRoom(std::optional<Token> const& token) -> RoomView
    {
        Session const s = RequireSession(token);
        return MakeRoomView(rooms_.LeaveRoom(s), std::nullopt);
    }

    auto Service::RefreshBoard(std::optional<Token> const& token) -> RoomView
    {
        Session const s = RequireSession(token);
        return MakeRoomView(rooms_.RefreshBoard(s), s.seat);
    }

    auto Service::StartRoom(std::optional<Token> const& token) -> GameId
    {
        Session const s = RequireSession(token);
        return rooms_.StartRoom(s);
    }

    auto Service::GetRoomGame(std::optional<Token> const& token, std::optional<Version> const version) const
        -> Snapshot
    {
        Session const s = RequireSession(token);
        return rooms_.GetRoomGame(s, version);
    }

    auto Service::SubmitAction(std::optional<Token> const& token,
                               ActionPayload const& payload,
                               std::optional<Version> const expected_version) -> Snapshot
    {
        Session const s = RequireSession(token);
        return gateway_.SubmitAction(s, payload, expected_version);
    }
}
