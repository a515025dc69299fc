//
// Dispatcher.cpp
//

#include "Dispatcher.hpp"

#include <exception>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace parley::core::net
{
    Dispatcher::Dispatcher(Service& service, GameOverFn on_game_over) :
        service_{service},
        on_game_over_{std::move(on_game_over)}
    {
    }

    auto Dispatcher::Handle(std::span<std::byte const> frame) -> flatbuffers::DetachedBuffer
    {
        std::expected<DecodedRequest, ParseError> parsed = DecodeRequest(frame);
        if (!parsed.has_value())
        {
            spdlog::warn("[Dispatch] Parse error: {}", parsed.error().message);
            return BuildError(error::Code::Validation, parsed.error().message, 0);
        }
        return Handle(*parsed);
    }

    auto Dispatcher::Handle(DecodedRequest const& request) -> flatbuffers::DetachedBuffer
    {
        try
        {
            return Route(request.request, request.request_id);
        }
        catch (error::Error const& e)
        {
            if (e.data() == error::Code::Internal)
            {
                spdlog::error("[Dispatch] {}", e);
            }
            else
            {
                spdlog::warn("[Dispatch] Request {} failed: {} ({})", request.request_id, e.what(),
                             error::to_string(e.data()));
            }
            return BuildError(e.data(), e.what(), request.request_id);
        }
        catch (std::exception const& e)
        {
            spdlog::error("[Dispatch] Request {} failed unexpectedly: {}", request.request_id, e.what());
            return BuildError(error::Code::Internal, e.what(), request.request_id);
        }
    }

    auto Dispatcher::Reply(Snapshot const& snap, std::uint64_t const id) -> flatbuffers::DetachedBuffer
    {
        if (snap.view.winner.has_value() && on_game_over_)
        {
            on_game_over_(snap.game_id);
        }
        return BuildSnapshot(snap, id);
    }

    auto Dispatcher::Route(Request const& request, std::uint64_t const id) -> flatbuffers::DetachedBuffer
    {
        return std::visit([&]<typename T0>(T0 const& r) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, req::CreateRoom>)
            {
                return BuildRoomView(service_.CreateRoom(r.name), id);
            }
            else if constexpr (std::is_same_v<T, req::ListRooms>)
            {
                std::vector<RoomView> const rooms = service_.ListRooms();
                return BuildRoomList(rooms, id);
            }
            else if constexpr (std::is_same_v<T, req::JoinRoom>)
            {
                return BuildJoin(service_.JoinRoom(r.room_id, r.name), id);
            }
            else if constexpr (std::is_same_v<T, req::RoomStatus>)
            {
                return BuildRoomView(service_.RoomStatus(r.room_id, r.token), id);
            }
            else if constexpr (std::is_same_v<T, req::LeaveRoom>)
            {
                return BuildRoomView(service_.LeaveRoom(r.token), id);
            }
            else if constexpr (std::is_same_v<T, req::RefreshBoard>)
            {
                return BuildRoomView(service_.RefreshBoard(r.token), id);
            }
            else if constexpr (std::is_same_v<T, req::StartRoom>)
            {
                return BuildStarted(service_.StartRoom(r.token), id);
            }
            else if constexpr (std::is_same_v<T, req::GetRoomGame>)
            {
                return BuildSnapshot(service_.GetRoomGame(r.token, r.version), id);
            }
            else if constexpr (std::is_same_v<T, req::SubmitAction>)
            {
                return Reply(service_.SubmitAction(r.token, r.action, r.expected_version), id);
            }
            else if constexpr (std::is_same_v<T, req::CreateGame>)
            {
                return BuildGameCreated(service_.Games().CreateGame(r.players), id);
            }
            else if constexpr (std::is_same_v<T, req::ListGames>)
            {
                std::vector<Summary> const games = service_.Games().ListGames();
                return BuildGameList(games, id);
            }
            else if constexpr (std::is_same_v<T, req::GetGame>)
            {
                return BuildSnapshot(service_.Games().GetGame(r.game_id, r.version), id);
            }
            else if constexpr (std::is_same_v<T, req::GameAction>)
            {
                return Reply(service_.Games().PostAction(r.game_id, r.action), id);
            }
            else if constexpr (std::is_same_v<T, req::DeleteGame>)
            {
                service_.Games().DeleteGame(r.game_id);
                return BuildDeleted(r.game_id, id);
            }
            else
            {
                std::vector<Event> const events = service_.Games().ListEvents(r.game_id, r.type);
                return BuildEventList(events, id);
            }
        }, request);
    }
}
