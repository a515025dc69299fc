//
// Room.hpp
//

#ifndef PARLEY_ROOM_HPP
#define PARLEY_ROOM_HPP

#include <optional>
#include <string>
#include <vector>

#include "Board.hpp"
#include "Types.hpp"

namespace parley::core
{
    struct Seat
    {
        Color color{};
        std::optional<std::string> user_name;
    };

    // Seat list is fixed at creation, in SeatOrder; seats.front() is the host.
    struct Room
    {
        RoomId room_id;
        std::string name;
        std::vector<Seat> seats;
        bool started{false};
        std::optional<GameId> game_id;
        std::optional<Version> latest_version;
        uint64_t board_seed{};
        Timestamp created_at{};
        Timestamp updated_at{};

        auto HostColor() const -> Color { return seats.front().color; }
        auto SeatNamed(std::string_view name) const -> std::optional<Color>;
        auto FirstEmptySeat() -> Seat*;
        auto FindSeat(Color c) -> Seat*;
        auto OccupiedCount() const -> std::size_t;
    };

    struct SeatInfo
    {
        Color color{};
        std::optional<std::string> user_name;
        bool is_you{false};
    };

    struct RoomView
    {
        RoomId room_id;
        std::string name;
        std::vector<SeatInfo> seats;
        bool started{false};
        std::optional<GameId> game_id;
        std::optional<Version> latest_version;
        std::string created_at; // ISO-8601 UTC
        std::string updated_at;
        Board board_preview;
    };

    auto MakeRoomView(Room const& room, std::optional<Color> you) -> RoomView;
}

#endif //PARLEY_ROOM_HPP
