//
// Service.hpp
//

#ifndef PARLEY_SERVICE_HPP
#define PARLEY_SERVICE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ActionGateway.hpp"
#include "GameService.hpp"
#include "PlayerFactory.hpp"
#include "Room.hpp"
#include "RoomManager.hpp"
#include "RoomStore.hpp"
#include "Rules.hpp"
#include "SessionRegistry.hpp"
#include "StateStore.hpp"
#include "TurnAdvancer.hpp"

namespace parley::core
{
    struct JoinView
    {
        Token token;
        std::optional<Color> seat;
        bool is_spectator{false};
        RoomView room;
    };

    // Everything a transport needs, keyed by plain ids and tokens.
    // Owns the session registry and room store; borrows store, rules and players.
    class Service
    {
    public:
        Service(StateStore& store, Rules const& rules, PlayerFactory const& players, Config cfg);

        // Missing/unknown token: Auth. Token for another room: Authorization.
        auto RequireSession(std::optional<Token> const& token,
                            std::optional<RoomId> const& room_id = std::nullopt) const -> Session;
        // Like RequireSession, but no token at all is fine.
        auto PeekSession(std::optional<Token> const& token, RoomId const& room_id) const -> std::optional<Session>;

        auto CreateRoom(std::string_view name) -> RoomView;
        auto ListRooms() const -> std::vector<RoomView>;
        auto JoinRoom(RoomId const& room_id, std::string_view name) -> JoinView;
        auto RoomStatus(RoomId const& room_id, std::optional<Token> const& token) const -> RoomView;
        auto LeaveRoom(std::optional<Token> const& token) -> RoomView;
        auto RefreshBoard(std::optional<Token> const& token) -> RoomView;
        auto StartRoom(std::optional<Token> const& token) -> GameId;
        auto GetRoomGame(std::optional<Token> const& token, std::optional<Version> version) const -> Snapshot;
        auto SubmitAction(std::optional<Token> const& token,
                          ActionPayload const& payload,
                          std::optional<Version> expected_version) -> Snapshot;

        auto Games() noexcept -> GameService& { return games_; }
        auto Games() const noexcept -> GameService const& { return games_; }
        auto Store() const noexcept -> StateStore& { return store_; }

    private:
        StateStore& store_;
        SessionRegistry sessions_;
        RoomStore room_store_;
        TurnAdvancer advancer_;
        RoomManager rooms_;
        ActionGateway gateway_;
        GameService games_;
    };
}

#endif //PARLEY_SERVICE_HPP
