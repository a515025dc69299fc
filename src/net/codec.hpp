//
// codec.hpp
//

#ifndef PARLEY_CODEC_HPP
#define PARLEY_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <flatbuffers/flatbuffers.h>

#include "../core/ActionPayload.hpp"
#include "../core/Exception.hpp"
#include "../core/Room.hpp"
#include "../core/Service.hpp"
#include "../core/StateStore.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/parley_net_generated.h"

namespace parley::core::net
{
    using ParseError = ::parley::core::ParseError;

    // Typed requests, one per wire request table.
    namespace req
    {
        struct CreateRoom { std::string name; };
        struct ListRooms {};
        struct JoinRoom { RoomId room_id; std::string name; };
        struct RoomStatus { RoomId room_id; std::optional<Token> token; };
        struct LeaveRoom { std::optional<Token> token; };
        struct RefreshBoard { std::optional<Token> token; };
        struct StartRoom { std::optional<Token> token; };
        struct GetRoomGame { std::optional<Token> token; std::optional<Version> version; };
        struct SubmitAction
        {
            std::optional<Token> token;
            ActionPayload action;
            std::optional<Version> expected_version;
        };
        struct CreateGame { std::vector<PlayerKind> players; };
        struct ListGames {};
        struct GetGame { GameId game_id; std::optional<Version> version; };
        struct GameAction { GameId game_id; std::optional<ActionPayload> action; };
        struct DeleteGame { GameId game_id; };
        struct ListEvents { GameId game_id; std::optional<std::string> type; };
    }

    using Request = std::variant<
      req::CreateRoom, req::ListRooms, req::JoinRoom, req::RoomStatus, req::LeaveRoom,
      req::RefreshBoard, req::StartRoom, req::GetRoomGame, req::SubmitAction,
      req::CreateGame, req::ListGames, req::GetGame, req::GameAction, req::DeleteGame,
      req::ListEvents>;

    struct DecodedRequest
    {
        std::uint64_t request_id{};
        Request request;
    };

    // --- Inbound decode (client -> server) ---

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>;

    // --- Outbound builders (server -> client) ---

    auto BuildRoomView(RoomView const& room, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildRoomList(std::span<RoomView const> rooms, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildJoin(JoinView const& join, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildStarted(GameId const& game_id, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildSnapshot(Snapshot const& snap, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildGameList(std::span<Summary const> games, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildGameCreated(GameId const& game_id, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildDeleted(GameId const& game_id, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildEventList(std::span<Event const> events, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildError(error::Code code, std::string_view message, std::uint64_t request_id)
        -> flatbuffers::DetachedBuffer;

    // --- Request builders (clients, tests) ---

    auto BuildCreateRoomReq(std::string_view name, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildJoinRoomReq(RoomId const& room_id, std::string_view name, std::uint64_t request_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildStartRoomReq(Token const& token, std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildSubmitActionReq(Token const& token,
                              ActionPayload const& action,
                              std::optional<Version> expected_version,
                              std::uint64_t request_id) -> flatbuffers::DetachedBuffer;
    auto BuildCreateGameReq(std::span<PlayerKind const> players, std::uint64_t request_id)
        -> flatbuffers::DetachedBuffer;
    auto BuildGameActionReq(GameId const& game_id,
                            std::optional<ActionPayload> const& action,
                            std::uint64_t request_id) -> flatbuffers::DetachedBuffer;

    // Reads a response buffer. nullptr if it does not verify.
    auto ReadResponse(std::span<std::byte const> bytes) -> parley::gen::net::ResponseEnvelope const*;
} // namespace parley::core::net

#endif //PARLEY_CODEC_HPP
